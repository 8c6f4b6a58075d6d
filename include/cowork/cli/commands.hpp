#pragma once

#include "cowork/events/types.hpp"
#include "cowork/permissions/types.hpp"

#include <optional>
#include <string>

namespace cowork::cli {

/// `y`/`yes` allow once, `a`/`always` allow for the rest of the session, anything else denies.
[[nodiscard]] permissions::PermissionResponse parse_approval_answer(const std::string &answer);

/// One terminal line for an event, or nothing for events the terminal does not show.
[[nodiscard]] std::optional<std::string> format_event(const events::AgentEvent &event);

int run_cli(int argc, char **argv);

} // namespace cowork::cli
