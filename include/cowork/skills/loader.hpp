#pragma once

#include "cowork/common/result.hpp"
#include "cowork/sandbox/process.hpp"
#include "cowork/skills/skill.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cowork::skills {

/// Loads SKILL.md plus bundled files. Directory layout:
///
///   skill-name/
///     SKILL.md
///     scripts/ references/ assets/ templates/ core/   (scanned recursively)
///     *.md                                           (root level notes)
class SkillLoader {
public:
  /// Archives are read through the `unzip` command.
  explicit SkillLoader(std::shared_ptr<sandbox::IProcessRunner> runner = nullptr);

  [[nodiscard]] common::Result<LoadedSkill> load_directory(const std::filesystem::path &dir) const;

  /// Only entries under the directory holding the first SKILL.md are kept, with that
  /// prefix stripped.
  [[nodiscard]] common::Result<LoadedSkill> load_zip(const std::filesystem::path &zip_path) const;

  /// Directory or `.zip` file.
  [[nodiscard]] common::Result<LoadedSkill> load(const std::filesystem::path &path) const;

  /// Every subdirectory of `skills_dir` with a parseable SKILL.md. A missing directory
  /// yields an empty list.
  [[nodiscard]] common::Result<std::vector<MarketplaceSkillInfo>>
  list_marketplace_skills(const std::filesystem::path &skills_dir) const;

  /// Loads every skill directory and archive directly inside `skills_dir`, skipping
  /// entries that fail with a warning.
  [[nodiscard]] std::vector<LoadedSkill> load_all(const std::filesystem::path &skills_dir) const;

private:
  std::shared_ptr<sandbox::IProcessRunner> runner_;
};

[[nodiscard]] bool should_include_file(const std::string &filename);
[[nodiscard]] std::string detect_file_type(const std::string &filename);

} // namespace cowork::skills
