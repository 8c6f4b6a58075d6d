#pragma once

#include "cowork/common/result.hpp"
#include "cowork/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace cowork::permissions {

/// Restricts paths and shell commands to a workspace when the scope is Workspace.
class ScopeEnforcer {
public:
  ScopeEnforcer() = default;
  ScopeEnforcer(config::ScopeType scope, std::optional<std::filesystem::path> workspace);

  [[nodiscard]] static ScopeEnforcer global();
  [[nodiscard]] static ScopeEnforcer workspace(std::filesystem::path workspace);

  [[nodiscard]] bool is_path_allowed(const std::filesystem::path &path) const;
  [[nodiscard]] common::Status validate_command(const std::string &command) const;

  [[nodiscard]] config::ScopeType scope_type() const { return scope_; }
  [[nodiscard]] const std::optional<std::filesystem::path> &workspace_path() const {
    return workspace_;
  }
  [[nodiscard]] bool is_workspace_scope() const { return scope_ == config::ScopeType::Workspace; }

private:
  config::ScopeType scope_ = config::ScopeType::Global;
  std::optional<std::filesystem::path> workspace_;
};

} // namespace cowork::permissions
