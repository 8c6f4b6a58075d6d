#pragma once

#include "cowork/tools/tool.hpp"

#include <optional>
#include <string>

namespace cowork::agent {

struct ParsedToolCall {
  std::string name;
  tools::ToolArgs arguments;
  std::string raw_arguments = "{}";
};

/// First JSON object in `reply` carrying a string `tool` member. `args` may be an object,
/// whose members become the argument map, or absent.
[[nodiscard]] std::optional<ParsedToolCall> parse_tool_call(const std::string &reply);

} // namespace cowork::agent
