#include "cowork/agent/tool_call.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/json_util.hpp"

namespace cowork::agent {

std::optional<ParsedToolCall> parse_tool_call(const std::string &reply) {
  for (const auto &object : common::find_json_objects(reply)) {
    const auto fields = common::json_parse_flat(object);
    const auto tool = fields.find("tool");
    if (tool == fields.end()) {
      continue;
    }
    const std::string name = common::trim(tool->second);
    if (name.empty() || common::starts_with(name, "{") || common::starts_with(name, "[")) {
      continue;
    }

    ParsedToolCall call;
    call.name = name;
    if (const auto args = fields.find("args"); args != fields.end()) {
      const std::string raw = common::trim(args->second);
      if (common::json_is_object(raw)) {
        call.raw_arguments = raw;
        call.arguments = common::json_parse_flat(raw);
      }
    }
    return call;
  }
  return std::nullopt;
}

} // namespace cowork::agent
