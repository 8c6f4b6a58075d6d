#include "cowork/skills/resolver.hpp"

#include "cowork/common/fs.hpp"

namespace cowork::skills {

common::Result<Backend> resolve_backend(const config::ExecutionMode agent_mode,
                                        const bool requires_sandbox,
                                        const std::optional<std::string> &preferred_mode,
                                        const bool docker_available) {
  switch (agent_mode) {
  case config::ExecutionMode::Sandbox:
    if (!docker_available) {
      return common::Result<Backend>::failure(
          "Security Policy Enforcement: Sandbox mode is enabled but Docker is not available.");
    }
    return common::Result<Backend>::success(Backend::Isolated);
  case config::ExecutionMode::Direct:
    if (requires_sandbox) {
      return common::Result<Backend>::failure(
          "Skill requires sandbox but Agent is in 'direct' execution mode.");
    }
    return common::Result<Backend>::success(Backend::Direct);
  case config::ExecutionMode::Flexible:
    break;
  }

  const std::string preference =
      preferred_mode.has_value() ? common::to_lower(common::trim(*preferred_mode)) : "flexible";
  if (preference == "sandbox") {
    if (!docker_available) {
      return common::Result<Backend>::failure(
          "Skill requires sandbox but Docker is not available.");
    }
    return common::Result<Backend>::success(Backend::Isolated);
  }
  if (preference == "direct") {
    return common::Result<Backend>::success(Backend::Direct);
  }
  return common::Result<Backend>::success(docker_available ? Backend::Isolated : Backend::Direct);
}

} // namespace cowork::skills
