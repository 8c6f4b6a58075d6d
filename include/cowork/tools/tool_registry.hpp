#pragma once

#include "cowork/tools/tool.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cowork::tools {

/// Name-keyed tool set. Lookup ignores case; registering a name twice replaces the earlier tool.
class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::vector<ITool *> all_tools() const;
  [[nodiscard]] std::size_t size() const { return by_name_.size(); }

  /// Tool list block appended to the agent preamble.
  [[nodiscard]] std::string render_prompt() const;

  /// filesystem, bash and search_files.
  [[nodiscard]] static ToolRegistry create_default();

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace cowork::tools
