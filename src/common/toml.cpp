#include "cowork/common/toml.hpp"

#include "cowork/common/fs.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace cowork::common {

namespace {

// Drops a trailing `# comment` that is not inside a quoted string.
std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    } else if (ch == '#' && !in_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> out;
  std::string current;
  bool in_quotes = false;
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (ch == '"' && (i == 0 || body[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (ch == ',' && !in_quotes) {
      out.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!trim(current).empty()) {
    out.push_back(trim(current));
  }
  return out;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() < 2) {
    return value;
  }
  const char q = value.front();
  if ((q != '"' && q != '\'') || value.back() != q) {
    return value;
  }
  value = value.substr(1, value.size() - 2);
  if (q == '\'') {
    return value;
  }
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      const char next = value[++i];
      out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

template <typename T> T parse_integral(const std::string &raw, T fallback) {
  const std::string normalized = trim(raw);
  T parsed{};
  const char *first = normalized.data();
  const char *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(unquote(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

int TomlDocument::get_int(const std::string &key, int fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_integral<int>(it->second, fallback);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : parse_integral<std::uint64_t>(it->second, fallback);
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = unquote(it->second);
  if (normalized.empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (end == nullptr || *end != '\0') {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']') {
        return Result<TomlDocument>::failure("Unterminated section header at line " +
                                             std::to_string(line_number));
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t eq = clean.find('=');
    if (eq == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }
    const std::string key = trim(clean.substr(0, eq));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number));
    }
    document.values[section.empty() ? key : section + "." + key] = trim(clean.substr(eq + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    if (ch == '\n') {
      out += "\\n";
      continue;
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

} // namespace cowork::common
