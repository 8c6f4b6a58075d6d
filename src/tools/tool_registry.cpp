#include "cowork/tools/tool_registry.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/tools/builtin/bash.hpp"
#include "cowork/tools/builtin/filesystem.hpp"
#include "cowork/tools/builtin/search.hpp"

#include <algorithm>
#include <sstream>

namespace cowork::tools {

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  if (!tool) {
    return;
  }
  const std::string key = common::to_lower(std::string(tool->name()));
  ITool *raw = tool.get();
  if (const auto it = by_name_.find(key); it != by_name_.end()) {
    auto existing = std::find_if(tools_.begin(), tools_.end(),
                                 [&](const auto &owned) { return owned.get() == it->second; });
    if (existing != tools_.end()) {
      *existing = std::move(tool);
    }
  } else {
    tools_.push_back(std::move(tool));
  }
  by_name_[key] = raw;
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

std::vector<ITool *> ToolRegistry::all_tools() const {
  std::vector<ITool *> out;
  out.reserve(tools_.size());
  for (const auto &tool : tools_) {
    out.push_back(tool.get());
  }
  return out;
}

std::string ToolRegistry::render_prompt() const {
  if (tools_.empty()) {
    return "";
  }
  std::ostringstream out;
  out << "You can call the following tools. To call one, reply with only a JSON object of the "
         "form {\"tool\": \"<name>\", \"args\": {...}} and nothing else. When you are done, "
         "reply with plain text.\n\nTools:\n";
  for (const auto &spec : all_specs()) {
    out << "- " << spec.name << ": " << spec.description << "\n  parameters: "
        << spec.parameters_json << "\n";
  }
  return out.str();
}

ToolRegistry ToolRegistry::create_default() {
  ToolRegistry registry;
  registry.register_tool(std::make_unique<FilesystemTool>());
  registry.register_tool(std::make_unique<BashTool>());
  registry.register_tool(std::make_unique<SearchTool>());
  return registry;
}

} // namespace cowork::tools
