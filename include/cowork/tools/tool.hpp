#pragma once

#include "cowork/common/result.hpp"
#include "cowork/config/schema.hpp"
#include "cowork/permissions/manager.hpp"
#include "cowork/permissions/scope.hpp"
#include "cowork/sandbox/sandbox.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cowork::tools {

/// Flat argument map. Nested JSON values arrive as raw JSON text.
using ToolArgs = std::unordered_map<std::string, std::string>;

enum class ToolErrorKind {
  None,
  MissingArgument,
  InvalidArgument,
  PermissionDenied,
  ExecutionFailed,
  ValidationFailed,
  SandboxUnavailable,
  PolicyConflict,
  Other,
};

[[nodiscard]] std::string_view to_string(ToolErrorKind kind);

/// Permission denials and backend selection failures stop the run; every other error is
/// reported back to the model.
[[nodiscard]] bool is_fatal(ToolErrorKind kind);

struct ToolResult {
  std::string output;
  bool success = true;
  bool truncated = false;
  ToolErrorKind error_kind = ToolErrorKind::None;
  std::unordered_map<std::string, std::string> metadata;

  [[nodiscard]] static ToolResult ok(std::string output);
  /// Failed result whose output is the rendered error, e.g. `Permission denied: x`.
  [[nodiscard]] static ToolResult error(ToolErrorKind kind, const std::string &detail);
  [[nodiscard]] static ToolResult missing_argument(const std::string &name);
  [[nodiscard]] static ToolResult invalid_argument(const std::string &name,
                                                   const std::string &reason);
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
};

struct ToolContext {
  std::filesystem::path workspace_path;
  std::string session_id;
  config::ExecutionMode execution_mode = config::ExecutionMode::Flexible;
  permissions::PermissionManager *permissions = nullptr;
  std::shared_ptr<sandbox::ISandbox> sandbox;
  /// Configured limits; tools layer their own overrides on top.
  sandbox::SandboxConfig sandbox_defaults;
  permissions::ScopeEnforcer scope;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  /// Pre-execution hint for the UI. Permission checks still happen inside execute.
  [[nodiscard]] virtual bool requires_approval(const ToolArgs &) const { return false; }
  [[nodiscard]] virtual bool needs_summarization(const ToolArgs &, const ToolResult &) const {
    return false;
  }

  [[nodiscard]] ToolSpec spec() const;
};

/// Asks `ctx.permissions`; no manager means the action is denied.
[[nodiscard]] common::Result<bool> check_permission(const ToolContext &ctx,
                                                    permissions::PermissionRequest request);

/// Rejects absolute paths and any path containing "..".
[[nodiscard]] common::Status validate_relative_path(const std::string &path);

} // namespace cowork::tools
