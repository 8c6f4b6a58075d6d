#pragma once

#include "cowork/common/result.hpp"
#include <filesystem>
#include <string>
#include <utility>

namespace cowork::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file(const std::filesystem::path &path, const std::string &content);

/// Create a fresh directory under the system temp dir named `<prefix>-<random>`.
[[nodiscard]] Result<std::filesystem::path> make_temp_dir(const std::string &prefix);

/// Owns a directory from make_temp_dir and removes it recursively on destruction.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::filesystem::path path) : path_(std::move(path)) {}
  ~ScopedTempDir();
  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

/// Shell-quote a single argument with POSIX single quotes.
[[nodiscard]] std::string shell_quote(const std::string &value);

} // namespace cowork::common
