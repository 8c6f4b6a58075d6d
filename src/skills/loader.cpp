#include "cowork/skills/loader.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/observability/log.hpp"
#include "cowork/skills/parser.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <utility>

namespace cowork::skills {

namespace {

constexpr std::array<const char *, 5> kScanDirs = {"scripts", "references", "assets",
                                                   "templates", "core"};
constexpr std::size_t kDisplayTitleChars = 50;
constexpr std::chrono::seconds kUnzipTimeout{60};

bool looks_binary(const std::string &content) { return content.find('\0') != std::string::npos; }

/// Text content of a file, or nothing for unreadable and binary files.
std::optional<std::string> read_text(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok() || looks_binary(content.value())) {
    observability::log_debug("skipping unreadable skill file " + path.string());
    return std::nullopt;
  }
  return content.value();
}

void collect_files_recursive(const std::filesystem::path &dir, const std::string &base_relative,
                             std::map<std::string, SkillFile> &files) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    observability::log_warn("failed to read skill directory " + dir.string() + ": " +
                            ec.message());
    return;
  }
  for (const auto &entry : it) {
    const std::string file_name = entry.path().filename().string();
    const std::string relative = base_relative + "/" + file_name;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      collect_files_recursive(entry.path(), relative, files);
    } else if (entry.is_regular_file(type_ec) && should_include_file(file_name)) {
      if (auto content = read_text(entry.path())) {
        files[relative] = SkillFile{.content = std::move(*content),
                                    .file_type = detect_file_type(file_name)};
      }
    }
  }
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> out;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      out.push_back(line);
    }
  }
  return out;
}

} // namespace

bool should_include_file(const std::string &filename) {
  static constexpr std::array<const char *, 21> kAllowed = {
      ".py",  ".js",   ".ts",  ".sh",   ".bash", ".zsh", ".md",
      ".txt", ".rst",  ".json", ".yaml", ".yml",  ".toml", ".html",
      ".css", ".xml",  ".xsd", ".sql",  ".j2",   ".jinja", ".jinja2"};
  const std::string lower = common::to_lower(filename);
  for (const char *ext : kAllowed) {
    if (common::ends_with(lower, ext)) {
      return true;
    }
  }
  return false;
}

std::string detect_file_type(const std::string &filename) {
  static const std::array<std::pair<const char *, const char *>, 21> kTypes = {{
      {".py", "python"},     {".js", "javascript"}, {".ts", "typescript"}, {".sh", "shell"},
      {".bash", "shell"},    {".zsh", "shell"},     {".md", "markdown"},   {".json", "json"},
      {".yaml", "yaml"},     {".yml", "yaml"},      {".toml", "toml"},     {".html", "html"},
      {".css", "css"},       {".xml", "xml"},       {".xsd", "xml"},       {".sql", "sql"},
      {".j2", "jinja"},      {".jinja", "jinja"},   {".jinja2", "jinja"},  {".txt", "text"},
      {".rst", "text"},
  }};
  const std::string lower = common::to_lower(filename);
  for (const auto &[ext, type] : kTypes) {
    if (common::ends_with(lower, ext)) {
      return type;
    }
  }
  return "unknown";
}

SkillLoader::SkillLoader(std::shared_ptr<sandbox::IProcessRunner> runner)
    : runner_(runner ? std::move(runner) : std::make_shared<sandbox::PosixProcessRunner>()) {}

common::Result<LoadedSkill> SkillLoader::load_directory(const std::filesystem::path &dir) const {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return common::Result<LoadedSkill>::failure("Path is not a directory: " + dir.string());
  }
  const auto manifest_path = dir / "SKILL.md";
  if (!std::filesystem::exists(manifest_path, ec)) {
    return common::Result<LoadedSkill>::failure("SKILL.md not found in " + dir.string());
  }
  auto manifest = common::read_file(manifest_path);
  if (!manifest.ok()) {
    return common::Result<LoadedSkill>::failure("Failed to read SKILL.md: " + manifest.error());
  }
  auto parsed = parse_skill_md(manifest.value());
  if (!parsed.ok()) {
    return common::Result<LoadedSkill>::failure(parsed.error());
  }

  LoadedSkill loaded;
  loaded.skill = std::move(parsed.value());
  for (const char *sub : kScanDirs) {
    const auto sub_path = dir / sub;
    if (std::filesystem::is_directory(sub_path, ec)) {
      collect_files_recursive(sub_path, sub, loaded.files);
    }
  }

  std::filesystem::directory_iterator it(dir, ec);
  if (!ec) {
    for (const auto &entry : it) {
      const std::string file_name = entry.path().filename().string();
      std::error_code type_ec;
      if (!entry.is_regular_file(type_ec) || file_name == "SKILL.md" ||
          !common::ends_with(file_name, ".md")) {
        continue;
      }
      if (auto content = read_text(entry.path())) {
        loaded.files[file_name] = SkillFile{.content = std::move(*content), .file_type = "markdown"};
      }
    }
  }
  return common::Result<LoadedSkill>::success(std::move(loaded));
}

common::Result<LoadedSkill> SkillLoader::load_zip(const std::filesystem::path &zip_path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(zip_path, ec)) {
    return common::Result<LoadedSkill>::failure("Failed to open ZIP file: " + zip_path.string());
  }

  sandbox::ProcessOptions options;
  options.timeout = kUnzipTimeout;
  auto listing = runner_->run({"unzip", "-Z1", zip_path.string()}, options);
  if (!listing.ok()) {
    return common::Result<LoadedSkill>::failure("Failed to read ZIP archive: " + listing.error());
  }
  if (listing.value().exit_code != 0) {
    return common::Result<LoadedSkill>::failure("Failed to read ZIP archive: " +
                                                common::trim(listing.value().stderr_text));
  }
  const auto entries = split_lines(listing.value().stdout_text);

  std::string base_dir;
  for (const auto &name : entries) {
    if (common::ends_with(name, "SKILL.md")) {
      base_dir = name.substr(0, name.size() - std::string("SKILL.md").size());
      break;
    }
  }

  auto scratch_path = common::make_temp_dir("cowork-skill-zip");
  if (!scratch_path.ok()) {
    return common::Result<LoadedSkill>::failure(scratch_path.error());
  }
  common::ScopedTempDir scratch(scratch_path.value());
  auto extracted = runner_->run(
      {"unzip", "-qq", "-o", zip_path.string(), "-d", scratch.path().string()}, options);
  if (!extracted.ok()) {
    return common::Result<LoadedSkill>::failure("Failed to read ZIP archive: " + extracted.error());
  }
  if (extracted.value().exit_code != 0) {
    return common::Result<LoadedSkill>::failure("Failed to read ZIP archive: " +
                                                common::trim(extracted.value().stderr_text));
  }

  std::optional<std::string> manifest;
  LoadedSkill loaded;
  for (const auto &name : entries) {
    if (common::ends_with(name, "/")) {
      continue;
    }
    if (!base_dir.empty() && !common::starts_with(name, base_dir)) {
      continue;
    }
    const std::string relative = name.substr(base_dir.size());
    auto content = read_text(scratch.path() / name);
    if (!content.has_value()) {
      continue;
    }
    if (relative == "SKILL.md") {
      manifest = std::move(*content);
    } else if (should_include_file(relative)) {
      loaded.files[relative] =
          SkillFile{.content = std::move(*content), .file_type = detect_file_type(relative)};
    }
  }

  if (!manifest.has_value()) {
    return common::Result<LoadedSkill>::failure("SKILL.md not found in ZIP archive");
  }
  auto parsed = parse_skill_md(*manifest);
  if (!parsed.ok()) {
    return common::Result<LoadedSkill>::failure(parsed.error());
  }
  loaded.skill = std::move(parsed.value());
  return common::Result<LoadedSkill>::success(std::move(loaded));
}

common::Result<LoadedSkill> SkillLoader::load(const std::filesystem::path &path) const {
  if (common::to_lower(path.extension().string()) == ".zip") {
    return load_zip(path);
  }
  return load_directory(path);
}

common::Result<std::vector<MarketplaceSkillInfo>>
SkillLoader::list_marketplace_skills(const std::filesystem::path &skills_dir) const {
  std::vector<MarketplaceSkillInfo> skills;
  std::error_code ec;
  if (!std::filesystem::is_directory(skills_dir, ec)) {
    return common::Result<std::vector<MarketplaceSkillInfo>>::success(std::move(skills));
  }
  std::filesystem::directory_iterator it(skills_dir, ec);
  if (ec) {
    return common::Result<std::vector<MarketplaceSkillInfo>>::failure(
        "Failed to read skills directory: " + ec.message());
  }

  for (const auto &entry : it) {
    std::error_code type_ec;
    if (!entry.is_directory(type_ec)) {
      continue;
    }
    const auto manifest_path = entry.path() / "SKILL.md";
    if (!std::filesystem::exists(manifest_path, type_ec)) {
      continue;
    }
    auto content = common::read_file(manifest_path);
    if (!content.ok()) {
      observability::log_warn("Failed to read SKILL.md in " + entry.path().string() + ": " +
                              content.error());
      continue;
    }
    auto parsed = parse_skill_md(content.value());
    if (!parsed.ok()) {
      observability::log_warn("Failed to parse SKILL.md in " + entry.path().string() + ": " +
                              parsed.error());
      continue;
    }
    const auto &skill = parsed.value();
    MarketplaceSkillInfo info;
    info.name = skill.name;
    info.display_title = skill.description.size() > kDisplayTitleChars
                             ? skill.description.substr(0, kDisplayTitleChars) + "..."
                             : skill.description;
    info.description = skill.description;
    info.category = skill.category;
    info.dir_name = entry.path().filename().string();
    info.dir_path = entry.path().string();
    skills.push_back(std::move(info));
  }

  std::sort(skills.begin(), skills.end(),
            [](const auto &a, const auto &b) { return a.dir_name < b.dir_name; });
  return common::Result<std::vector<MarketplaceSkillInfo>>::success(std::move(skills));
}

std::vector<LoadedSkill> SkillLoader::load_all(const std::filesystem::path &skills_dir) const {
  std::vector<LoadedSkill> out;
  std::error_code ec;
  std::filesystem::directory_iterator it(skills_dir, ec);
  if (ec) {
    observability::log_warn("cannot read skills directory " + skills_dir.string() + ": " +
                            ec.message());
    return out;
  }
  std::vector<std::filesystem::path> candidates;
  for (const auto &entry : it) {
    std::error_code type_ec;
    if (entry.is_directory(type_ec) ||
        common::to_lower(entry.path().extension().string()) == ".zip") {
      candidates.push_back(entry.path());
    }
  }
  std::sort(candidates.begin(), candidates.end());
  for (const auto &path : candidates) {
    auto loaded = load(path);
    if (!loaded.ok()) {
      observability::log_warn("skipping skill " + path.string() + ": " + loaded.error());
      continue;
    }
    out.push_back(std::move(loaded.value()));
  }
  return out;
}

} // namespace cowork::skills
