#include "cowork/tools/builtin/bash.hpp"

#include "cowork/common/json_util.hpp"

namespace cowork::tools {

std::string_view BashTool::name() const { return "bash"; }

std::string_view BashTool::description() const {
  return "Execute a bash command. Use this to run shell commands.";
}

std::string BashTool::parameters_schema() const {
  return R"({"type":"object","required":["command"],"properties":{"command":{"type":"string","description":"The command to execute"}}})";
}

bool BashTool::requires_approval(const ToolArgs &) const { return true; }

common::Result<ToolResult> BashTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  const auto it = args.find("command");
  if (it == args.end() || it->second.empty()) {
    return common::Result<ToolResult>::success(ToolResult::missing_argument("command"));
  }
  const std::string &command = it->second;

  if (ctx.scope.is_workspace_scope()) {
    if (auto scoped = ctx.scope.validate_command(command); !scoped.ok()) {
      return common::Result<ToolResult>::success(
          ToolResult::error(ToolErrorKind::ValidationFailed, scoped.error()));
    }
  }

  auto request = permissions::PermissionRequest::create(permissions::PermissionType::ShellExecute,
                                                        "Agent wants to run command: " + command);
  request.with_resource(command);
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
  auto config = ctx.sandbox_defaults;
  config.with_network(true);
  if (!config.timeout_seconds.has_value()) {
    config.with_timeout(kTimeoutSeconds);
  }
  auto run = ctx.sandbox->execute(command, ctx.workspace_path, config);
  if (!run.ok()) {
    return common::Result<ToolResult>::success(
        ToolResult::error(ToolErrorKind::SandboxUnavailable, run.error()));
  }

  const auto &out = run.value();
  ToolResult result = ToolResult::ok("{\"stdout\":" + common::json_quote(out.stdout_text) +
                                     ",\"stderr\":" + common::json_quote(out.stderr_text) +
                                     ",\"exit_code\":" + std::to_string(out.exit_code) + "}");
  result.metadata["exit_code"] = std::to_string(out.exit_code);
  if (out.timed_out) {
    result.metadata["timed_out"] = "true";
  }
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace cowork::tools
