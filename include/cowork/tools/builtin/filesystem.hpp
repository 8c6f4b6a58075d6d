#pragma once

#include "cowork/tools/tool.hpp"

namespace cowork::tools {

/// read_file, write_file, list_dir, make_dir and delete_file on workspace-relative paths.
class FilesystemTool final : public ITool {
public:
  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool requires_approval(const ToolArgs &args) const override;
  [[nodiscard]] bool needs_summarization(const ToolArgs &args,
                                         const ToolResult &result) const override;
};

} // namespace cowork::tools
