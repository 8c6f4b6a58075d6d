#include "cowork/skills/parser.hpp"

#include "cowork/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace cowork::skills {

namespace {

constexpr std::size_t kMaxNameLength = 64;
constexpr std::size_t kMaxDescriptionLength = 1024;

std::string extract_value(const std::string &line, const std::string &key) {
  std::string value = common::trim(line.substr(key.size()));
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::optional<double> parse_double(const std::string &value) {
  if (value.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end == value.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::uint64_t> parse_unsigned(const std::string &value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
      })) {
    return std::nullopt;
  }
  return std::strtoull(value.c_str(), nullptr, 10);
}

bool valid_name(const std::string &name) {
  for (const unsigned char ch : name) {
    if (std::isalnum(ch) == 0 && ch != '-' && ch != '_') {
      return false;
    }
  }
  return true;
}

/// Accumulates the nested sandbox_config block.
struct SandboxBlock {
  SkillSandboxConfig config;

  [[nodiscard]] bool worth_keeping() const {
    return config.image.has_value() || config.memory_limit.has_value() ||
           config.timeout_seconds.has_value();
  }

  /// Consumes the line when it is one of the nested keys.
  bool consume(const std::string &line) {
    if (common::starts_with(line, "image:")) {
      config.image = extract_value(line, "image:");
    } else if (common::starts_with(line, "memory_limit:")) {
      config.memory_limit = extract_value(line, "memory_limit:");
    } else if (common::starts_with(line, "cpu_limit:")) {
      config.cpu_limit = parse_double(extract_value(line, "cpu_limit:"));
    } else if (common::starts_with(line, "timeout_seconds:")) {
      config.timeout_seconds = parse_unsigned(extract_value(line, "timeout_seconds:"));
    } else if (common::starts_with(line, "network_enabled:")) {
      const std::string value = extract_value(line, "network_enabled:");
      config.network_enabled = value == "true" || value == "yes";
    } else {
      return false;
    }
    return true;
  }
};

} // namespace

sandbox::SandboxConfig SkillSandboxConfig::to_sandbox_config() const {
  sandbox::SandboxConfig out;
  out.image = image;
  out.memory_limit = memory_limit;
  out.cpu_limit = cpu_limit;
  out.timeout_seconds = timeout_seconds;
  out.network_enabled = network_enabled;
  return out;
}

common::Result<ParsedSkill> parse_skill_md(const std::string &content) {
  if (!common::starts_with(content, "---")) {
    return common::Result<ParsedSkill>::failure("SKILL.md must start with YAML frontmatter (---)");
  }
  const std::string after_open = content.substr(3);
  const auto close = after_open.find("\n---");
  if (close == std::string::npos) {
    return common::Result<ParsedSkill>::failure("Could not find end of YAML frontmatter");
  }

  ParsedSkill skill;
  skill.body = common::trim(after_open.substr(close + 4));

  bool in_triggers = false;
  bool in_sandbox_config = false;
  std::vector<std::string> triggers;
  SandboxBlock sandbox_block;

  std::istringstream lines(common::trim(after_open.substr(0, close)));
  std::string raw;
  while (std::getline(lines, raw)) {
    const std::string line = common::trim(raw);

    if (in_triggers) {
      if (common::starts_with(line, "- ")) {
        triggers.push_back(common::trim(line.substr(2)));
        continue;
      }
      if (!line.empty()) {
        in_triggers = false;
        skill.triggers = triggers;
      }
    }

    if (in_sandbox_config) {
      if (sandbox_block.consume(line)) {
        continue;
      }
      if (!line.empty()) {
        in_sandbox_config = false;
        if (sandbox_block.worth_keeping()) {
          skill.sandbox_config = sandbox_block.config;
        }
        sandbox_block = SandboxBlock{};
      }
    }

    if (common::starts_with(line, "name:")) {
      skill.name = extract_value(line, "name:");
    } else if (common::starts_with(line, "description:")) {
      skill.description = extract_value(line, "description:");
    } else if (common::starts_with(line, "license:")) {
      skill.license = extract_value(line, "license:");
    } else if (common::starts_with(line, "category:")) {
      skill.category = extract_value(line, "category:");
    } else if (common::starts_with(line, "triggers:")) {
      in_triggers = true;
      triggers.clear();
    } else if (common::starts_with(line, "requires_sandbox:")) {
      const std::string value = extract_value(line, "requires_sandbox:");
      skill.requires_sandbox = value == "true" || value == "yes" || value == "1";
    } else if (common::starts_with(line, "sandbox_config:")) {
      in_sandbox_config = true;
    } else if (common::starts_with(line, "execution_mode:")) {
      skill.execution_mode = extract_value(line, "execution_mode:");
    }
  }

  if (in_triggers && !triggers.empty()) {
    skill.triggers = triggers;
  }
  if (in_sandbox_config && sandbox_block.worth_keeping()) {
    skill.sandbox_config = sandbox_block.config;
  }

  if (skill.name.empty()) {
    return common::Result<ParsedSkill>::failure("SKILL.md must have a 'name' field in frontmatter");
  }
  if (skill.description.empty()) {
    return common::Result<ParsedSkill>::failure(
        "SKILL.md must have a 'description' field in frontmatter");
  }
  if (skill.name.size() > kMaxNameLength) {
    return common::Result<ParsedSkill>::failure("Skill name must be 64 characters or less");
  }
  if (!valid_name(skill.name)) {
    return common::Result<ParsedSkill>::failure(
        "Skill name must only contain alphanumeric characters, hyphens, and underscores");
  }
  if (skill.description.size() > kMaxDescriptionLength) {
    return common::Result<ParsedSkill>::failure(
        "Skill description must be 1024 characters or less");
  }
  return common::Result<ParsedSkill>::success(std::move(skill));
}

} // namespace cowork::skills
