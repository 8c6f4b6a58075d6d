#include "cowork/permissions/scope.hpp"

#include "cowork/common/fs.hpp"

#include <array>
#include <sstream>

namespace cowork::permissions {

namespace {

constexpr std::array<const char *, 7> kEscapePatterns = {
    "cd /", "cd ~", "cd ..", "rm -rf /", "rm -rf ~", "> /", ">> /",
};

} // namespace

ScopeEnforcer::ScopeEnforcer(config::ScopeType scope, std::optional<std::filesystem::path> workspace)
    : scope_(scope), workspace_(std::move(workspace)) {}

ScopeEnforcer ScopeEnforcer::global() { return ScopeEnforcer(); }

ScopeEnforcer ScopeEnforcer::workspace(std::filesystem::path workspace) {
  return ScopeEnforcer(config::ScopeType::Workspace, std::move(workspace));
}

bool ScopeEnforcer::is_path_allowed(const std::filesystem::path &path) const {
  if (scope_ == config::ScopeType::Global) {
    return true;
  }
  if (!workspace_.has_value()) {
    return false;
  }

  std::error_code ec;
  const auto root = std::filesystem::canonical(*workspace_, ec);
  if (ec) {
    return false;
  }

  const auto resolved = std::filesystem::canonical(path, ec);
  if (!ec) {
    return common::is_subpath(resolved, root);
  }
  // Not created yet: judge by the parent directory.
  const auto parent = std::filesystem::canonical(path.parent_path(), ec);
  if (!ec) {
    return common::is_subpath(parent, root);
  }
  return common::is_subpath(path.lexically_normal(), workspace_->lexically_normal());
}

common::Status ScopeEnforcer::validate_command(const std::string &command) const {
  if (scope_ == config::ScopeType::Global) {
    return common::Status::success();
  }
  if (!workspace_.has_value()) {
    return common::Status::error("No workspace path set for workspace scope");
  }

  for (const char *pattern : kEscapePatterns) {
    if (command.find(pattern) != std::string::npos) {
      return common::Status::error("Command contains potentially dangerous pattern '" +
                                   std::string(pattern) + "' that may escape workspace");
    }
  }

  std::istringstream words(command);
  std::string word;
  while (words >> word) {
    if (!word.empty() && word.front() == '/' && !is_path_allowed(word)) {
      return common::Status::error("Command references path '" + word + "' outside workspace '" +
                                   workspace_->string() + "'");
    }
  }
  return common::Status::success();
}

} // namespace cowork::permissions
