#pragma once

#include "cowork/common/result.hpp"
#include "cowork/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace cowork::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Non-fatal problems with an otherwise loadable configuration.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Workspace directory in effect: configured value expanded, else the current directory.
[[nodiscard]] std::filesystem::path resolve_workspace(const Config &config);

/// SQLite job store location: configured value expanded, else <config_dir>/cowork.db.
[[nodiscard]] common::Result<std::filesystem::path> resolve_store_path(const Config &config);

} // namespace cowork::config
