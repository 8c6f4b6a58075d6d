#pragma once

#include "cowork/skills/skill.hpp"
#include "cowork/tools/tool.hpp"

#include <memory>

namespace cowork::skills {

/// Exposes a loaded skill as a tool taking a single `args` string. `read` returns the skill
/// body; anything else is a shell command run next to the skill's files on the backend
/// chosen by resolve_backend.
class SkillTool final : public tools::ITool {
public:
  static constexpr const char *kDefaultImage = "alpine:latest";
  static constexpr const char *kDefaultMemory = "128m";
  static constexpr std::uint64_t kTimeoutSeconds = 60;

  SkillTool(LoadedSkill skill, std::shared_ptr<sandbox::ISandbox> isolated,
            std::shared_ptr<sandbox::ISandbox> direct);

  [[nodiscard]] std::string_view name() const override { return skill_.skill.name; }
  [[nodiscard]] std::string_view description() const override { return description_; }
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override;

  [[nodiscard]] bool requires_approval(const tools::ToolArgs &args) const override;

  [[nodiscard]] const LoadedSkill &skill() const { return skill_; }

private:
  LoadedSkill skill_;
  std::string description_;
  std::shared_ptr<sandbox::ISandbox> isolated_;
  std::shared_ptr<sandbox::ISandbox> direct_;
};

} // namespace cowork::skills
