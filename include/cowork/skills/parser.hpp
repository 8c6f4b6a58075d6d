#pragma once

#include "cowork/common/result.hpp"
#include "cowork/skills/skill.hpp"

#include <string>

namespace cowork::skills {

/// Parses a SKILL.md document: a `---` delimited key/value frontmatter followed by a
/// markdown body.
///
/// Accepted frontmatter keys are name, description, license, category, requires_sandbox,
/// execution_mode, `triggers:` followed by `- item` lines, and `sandbox_config:` followed
/// by image, memory_limit, cpu_limit, timeout_seconds and network_enabled lines. Values may
/// be wrapped in single or double quotes. Unknown keys are ignored.
[[nodiscard]] common::Result<ParsedSkill> parse_skill_md(const std::string &content);

} // namespace cowork::skills
