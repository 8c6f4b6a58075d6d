#include "cowork/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <random>
#include <regex>
#include <sstream>

namespace cowork::common {

namespace {

bool is_space(unsigned char c) { return std::isspace(c) != 0; }

} // namespace

std::string trim(const std::string &input) {
  const auto first = std::find_if_not(input.begin(), input.end(), is_space);
  const auto last = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  return first < last ? std::string(first, last) : std::string();
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (!value.empty() && value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::string expanded;
  auto begin = std::sregex_iterator(value.begin(), value.end(), env_pattern);
  std::size_t last = 0;
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    expanded.append(value, last, static_cast<std::size_t>(it->position()) - last);
    if (const char *var = std::getenv((*it)[1].str().c_str()); var != nullptr) {
      expanded += var;
    }
    last = static_cast<std::size_t>(it->position() + it->length());
  }
  expanded.append(value, last, std::string::npos);
  return expanded;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  for (auto p_it = parent.begin(); p_it != parent.end(); ++p_it, ++c_it) {
    if (p_it->empty() && std::next(p_it) == parent.end()) {
      break;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }
  return true;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Failed to open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Result<std::string>::success(buffer.str());
}

Status write_file(const std::filesystem::path &path, const std::string &content) {
  if (path.has_parent_path()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return Status::error(dir.error());
    }
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return Status::error("Failed to open file for writing: " + path.string());
  }
  out << content;
  if (!out) {
    return Status::error("Failed to write file: " + path.string());
  }
  return Status::success();
}

Result<std::filesystem::path> make_temp_dir(const std::string &prefix) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::error_code ec;
  const auto base = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("No temp directory: " + ec.message());
  }
  for (int attempt = 0; attempt < 8; ++attempt) {
    const auto candidate = base / (prefix + "-" + std::to_string(rng()));
    if (std::filesystem::create_directory(candidate, ec)) {
      return Result<std::filesystem::path>::success(candidate);
    }
  }
  return Result<std::filesystem::path>::failure("Failed to create temp directory under " +
                                                base.string());
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::string shell_quote(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

} // namespace cowork::common
