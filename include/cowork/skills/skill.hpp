#pragma once

#include "cowork/sandbox/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cowork::skills {

/// Container limits a skill asks for. Present only when the manifest sets an image,
/// a memory limit or a timeout.
struct SkillSandboxConfig {
  std::optional<std::string> image;
  std::optional<std::string> memory_limit;
  std::optional<double> cpu_limit;
  std::optional<std::uint64_t> timeout_seconds;
  std::optional<bool> network_enabled;

  [[nodiscard]] sandbox::SandboxConfig to_sandbox_config() const;
};

struct ParsedSkill {
  std::string name;
  std::string description;
  std::optional<std::string> license;
  std::optional<std::string> category;
  std::optional<std::vector<std::string>> triggers;
  bool requires_sandbox = false;
  std::optional<SkillSandboxConfig> sandbox_config;
  /// "sandbox", "direct" or "flexible" as written in the manifest.
  std::optional<std::string> execution_mode;
  std::string body;
};

struct SkillFile {
  std::string content;
  std::string file_type;
};

struct LoadedSkill {
  ParsedSkill skill;
  /// Relative path -> content.
  std::map<std::string, SkillFile> files;
};

struct MarketplaceSkillInfo {
  std::string name;
  std::string display_title;
  std::string description;
  std::optional<std::string> category;
  std::string dir_name;
  std::string dir_path;
};

} // namespace cowork::skills
