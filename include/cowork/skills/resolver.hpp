#pragma once

#include "cowork/common/result.hpp"
#include "cowork/config/schema.hpp"

#include <optional>
#include <string>

namespace cowork::skills {

enum class Backend { Isolated, Direct };

/// Picks the backend for one skill invocation. Depends only on its arguments.
///
/// Agent mode sandbox requires docker. Agent mode direct refuses skills that require
/// isolation. Agent mode flexible follows the skill's preferred mode, and with no
/// preference uses docker when it is available.
[[nodiscard]] common::Result<Backend>
resolve_backend(config::ExecutionMode agent_mode, bool requires_sandbox,
                const std::optional<std::string> &preferred_mode, bool docker_available);

} // namespace cowork::skills
