#pragma once

#include "cowork/tools/tool.hpp"

#include <cstdint>

namespace cowork::tools {

/// Recursive grep over a workspace-relative path.
class SearchTool final : public ITool {
public:
  static constexpr std::uint64_t kTimeoutSeconds = 60;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
};

} // namespace cowork::tools
