#include "cowork/tools/tool.hpp"

namespace cowork::tools {

std::string_view to_string(const ToolErrorKind kind) {
  switch (kind) {
  case ToolErrorKind::None:
    return "none";
  case ToolErrorKind::MissingArgument:
    return "missing_argument";
  case ToolErrorKind::InvalidArgument:
    return "invalid_argument";
  case ToolErrorKind::PermissionDenied:
    return "permission_denied";
  case ToolErrorKind::ExecutionFailed:
    return "execution_failed";
  case ToolErrorKind::ValidationFailed:
    return "validation_failed";
  case ToolErrorKind::SandboxUnavailable:
    return "sandbox_unavailable";
  case ToolErrorKind::PolicyConflict:
    return "policy_conflict";
  case ToolErrorKind::Other:
    return "other";
  }
  return "other";
}

bool is_fatal(const ToolErrorKind kind) {
  return kind == ToolErrorKind::PermissionDenied || kind == ToolErrorKind::SandboxUnavailable ||
         kind == ToolErrorKind::PolicyConflict;
}

ToolResult ToolResult::ok(std::string output) {
  ToolResult result;
  result.output = std::move(output);
  return result;
}

ToolResult ToolResult::error(const ToolErrorKind kind, const std::string &detail) {
  ToolResult result;
  result.success = false;
  result.error_kind = kind;
  switch (kind) {
  case ToolErrorKind::MissingArgument:
    result.output = "Missing required argument: " + detail;
    break;
  case ToolErrorKind::PermissionDenied:
    result.output = "Permission denied: " + detail;
    break;
  case ToolErrorKind::ExecutionFailed:
    result.output = "Execution failed: " + detail;
    break;
  case ToolErrorKind::ValidationFailed:
    result.output = "Validation failed: " + detail;
    break;
  default:
    result.output = detail;
    break;
  }
  return result;
}

ToolResult ToolResult::missing_argument(const std::string &name) {
  return error(ToolErrorKind::MissingArgument, name);
}

ToolResult ToolResult::invalid_argument(const std::string &name, const std::string &reason) {
  ToolResult result = error(ToolErrorKind::InvalidArgument, "");
  result.output = "Invalid argument '" + name + "': " + reason;
  return result;
}

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema()};
}

common::Result<bool> check_permission(const ToolContext &ctx,
                                      permissions::PermissionRequest request) {
  if (ctx.permissions == nullptr) {
    return common::Result<bool>::success(false);
  }
  if (!ctx.session_id.empty() && request.session_id().empty()) {
    request.with_session_id(ctx.session_id);
  }
  return ctx.permissions->check(request);
}

common::Status validate_relative_path(const std::string &path) {
  if (path.find("..") != std::string::npos || (!path.empty() && path.front() == '/')) {
    return common::Status::error("Paths must be relative and cannot contain '..'");
  }
  return common::Status::success();
}

} // namespace cowork::tools
