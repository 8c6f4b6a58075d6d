#include "cowork/skills/skill_tool.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/json_util.hpp"
#include "cowork/observability/log.hpp"
#include "cowork/skills/resolver.hpp"

namespace cowork::skills {

namespace {

bool is_read_request(const tools::ToolArgs &args) {
  const auto it = args.find("args");
  return it != args.end() && common::to_lower(common::trim(it->second)) == "read";
}

std::string describe(const ParsedSkill &skill) {
  std::string base = skill.description;
  while (!base.empty() && base.back() == '.') {
    base.pop_back();
  }
  return base + ". IMPORTANT: Before using this skill, call it with args='read' to get detailed "
                "instructions and code examples.";
}

common::Status materialize(const LoadedSkill &skill, const std::filesystem::path &root) {
  for (const auto &[relative, file] : skill.files) {
    auto written = common::write_file(root / relative, file.content);
    if (!written.ok()) {
      return common::Status::error("Failed to write file " + relative + ": " + written.error());
    }
  }
  return common::Status::success();
}

std::string stdout_stderr_json(const sandbox::ExecutionResult &result) {
  return "{\"stdout\":" + common::json_quote(result.stdout_text) +
         ",\"stderr\":" + common::json_quote(result.stderr_text) + "}";
}

} // namespace

SkillTool::SkillTool(LoadedSkill skill, std::shared_ptr<sandbox::ISandbox> isolated,
                     std::shared_ptr<sandbox::ISandbox> direct)
    : skill_(std::move(skill)), description_(describe(skill_.skill)),
      isolated_(std::move(isolated)), direct_(std::move(direct)) {}

std::string SkillTool::parameters_schema() const {
  return R"({"type":"object","required":["args"],"properties":{"args":{"type":"string",)"
         R"("description":"Either 'read' to get the full skill guide with code examples, or a shell command to execute. ALWAYS use 'read' first to learn how to use this skill properly."}}})";
}

bool SkillTool::requires_approval(const tools::ToolArgs &args) const {
  return !is_read_request(args);
}

common::Result<tools::ToolResult> SkillTool::execute(const tools::ToolArgs &args,
                                                     const tools::ToolContext &ctx) {
  using tools::ToolErrorKind;
  using tools::ToolResult;
  using ResultT = common::Result<ToolResult>;

  const auto it = args.find("args");
  if (it == args.end() || common::trim(it->second).empty()) {
    return ResultT::success(ToolResult::missing_argument("args"));
  }
  if (is_read_request(args)) {
    return ResultT::success(
        ToolResult::ok("{\"content\":" + common::json_quote(skill_.skill.body) + "}"));
  }
  const std::string &command = it->second;

  const bool docker_available = isolated_ && isolated_->is_available();
  auto backend = resolve_backend(ctx.execution_mode, skill_.skill.requires_sandbox,
                                 skill_.skill.execution_mode, docker_available);
  if (!backend.ok()) {
    const auto kind = ctx.execution_mode == config::ExecutionMode::Direct
                          ? ToolErrorKind::PolicyConflict
                          : ToolErrorKind::SandboxUnavailable;
    return ResultT::success(ToolResult::error(kind, backend.error()));
  }
  const bool use_docker = backend.value() == Backend::Isolated;
  if (!use_docker && !direct_) {
    return ResultT::success(
        ToolResult::error(ToolErrorKind::SandboxUnavailable, "No direct execution backend"));
  }

  auto request = permissions::PermissionRequest::create(
      permissions::PermissionType::ShellExecute,
      "Agent wants to run skill " + skill_.skill.name + ": " + command);
  request.with_resource(command).with_metadata("skill", skill_.skill.name);
  auto allowed = tools::check_permission(ctx, std::move(request));
  if (!allowed.ok()) {
    return ResultT::success(ToolResult::error(ToolErrorKind::PermissionDenied, allowed.error()));
  }
  if (!allowed.value()) {
    return ResultT::success(
        ToolResult::error(ToolErrorKind::PermissionDenied, "User denied permission"));
  }

  auto temp = common::make_temp_dir("cowork-skill");
  if (!temp.ok()) {
    return ResultT::success(ToolResult::error(
        ToolErrorKind::ExecutionFailed,
        "Failed to create temp dir for skill files: " + temp.error()));
  }
  common::ScopedTempDir files_dir(temp.value());
  if (auto written = materialize(skill_, files_dir.path()); !written.ok()) {
    return ResultT::success(ToolResult::error(ToolErrorKind::ExecutionFailed, written.error()));
  }

  auto config = ctx.sandbox_defaults;
  config.with_timeout(kTimeoutSeconds);
  if (use_docker) {
    config.with_memory_limit(kDefaultMemory);
    if (!config.image.has_value()) {
      config.with_image(kDefaultImage);
    }
    if (skill_.skill.sandbox_config.has_value()) {
      config = skill_.skill.sandbox_config->to_sandbox_config().layered_on(config);
    }
    observability::log_info("executing skill " + skill_.skill.name + " in docker");
  } else {
    observability::log_info("executing skill " + skill_.skill.name + " locally in " +
                            ctx.workspace_path.string());
  }

  auto &runner = use_docker ? isolated_ : direct_;
  auto run = runner->execute_with_files(command, ctx.workspace_path, files_dir.path(), config);
  if (!run.ok()) {
    return ResultT::success(ToolResult::error(ToolErrorKind::SandboxUnavailable, run.error()));
  }
  const auto &out = run.value();
  if (!out.success) {
    const std::string prefix = use_docker ? "Skill execution failed: " : "Local execution failed: ";
    ToolResult failed = ToolResult::error(
        ToolErrorKind::ExecutionFailed, prefix + out.stdout_text + "\nStderr: " + out.stderr_text);
    failed.metadata["exit_code"] = std::to_string(out.exit_code);
    return ResultT::success(std::move(failed));
  }
  ToolResult result = ToolResult::ok(stdout_stderr_json(out));
  result.metadata["backend"] = use_docker ? "docker" : "direct";
  return ResultT::success(std::move(result));
}

} // namespace cowork::skills
