#include "cowork/tools/builtin/search.hpp"

#include "cowork/common/fs.hpp"

namespace cowork::tools {

std::string_view SearchTool::name() const { return "search_files"; }

std::string_view SearchTool::description() const {
  return "Search for text patterns in files within the workspace. Uses grep recursively.";
}

std::string SearchTool::parameters_schema() const {
  return R"({"type":"object","required":["query"],"properties":{)"
         R"("query":{"type":"string","description":"The text or regex pattern to search for"},)"
         R"("path":{"type":"string","description":"Relative path to search in. Defaults to the workspace root."}}})";
}

common::Result<ToolResult> SearchTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const auto query_it = args.find("query");
  if (query_it == args.end() || query_it->second.empty()) {
    return common::Result<ToolResult>::success(ToolResult::missing_argument("query"));
  }
  std::string path = ".";
  if (const auto it = args.find("path"); it != args.end() && !it->second.empty()) {
    path = it->second;
  }
  if (auto valid = validate_relative_path(path); !valid.ok()) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::ValidationFailed, valid.error()));
  }

  auto request = permissions::PermissionRequest::create(
      permissions::PermissionType::FilesystemRead, "Agent wants to search files in " + path);
  request.with_resource(path).with_metadata("operation", "search");
  auto allowed = check_permission(ctx, std::move(request));
  if (!allowed.ok()) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::PermissionDenied, allowed.error()));
  }
  if (!allowed.value()) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::PermissionDenied, "User denied permission"));
  }

  if (!ctx.sandbox) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::SandboxUnavailable, "No execution backend configured"));
  }
  const std::string command =
      "grep -r -n " + common::shell_quote(query_it->second) + " " + common::shell_quote(path);
  auto run = ctx.sandbox->execute(command, ctx.workspace_path,
                                  sandbox::SandboxConfig::defaults().with_timeout(kTimeoutSeconds));
  if (!run.ok()) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::SandboxUnavailable, run.error()));
  }

  const auto &out = run.value();
  // grep exits 1 when nothing matched.
  if (out.exit_code == 1 && out.stderr_text.empty()) {
    return common::Result<ToolResult>::success(ToolResult::ok("No matches found."));
  }
  if (!out.success && out.exit_code != 1) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::ExecutionFailed, "grep failed: " + out.stderr_text));
  }
  if (out.stdout_text.empty()) {
    return common::Result<ToolResult>::success(ToolResult::ok("No matches found."));
  }
  return common::Result<ToolResult>::success(ToolResult::ok(out.stdout_text));
}

} // namespace cowork::tools
