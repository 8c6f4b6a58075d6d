#pragma once

#include "cowork/tools/tool.hpp"

#include <cstdint>

namespace cowork::tools {

/// Runs a shell command through the session sandbox after a ShellExecute check.
class BashTool final : public ITool {
public:
  static constexpr std::uint64_t kTimeoutSeconds = 300;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool requires_approval(const ToolArgs &args) const override;
};

} // namespace cowork::tools
