#include "cowork/sandbox/sandbox.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/observability/global.hpp"
#include "cowork/observability/log.hpp"

#include <cstdio>
#include <sstream>

namespace cowork::sandbox {

namespace {

// The host-side kill is a backstop; the in-band `timeout` normally fires first.
constexpr std::chrono::seconds kHostGrace{30};
constexpr std::chrono::seconds kProbeTimeout{10};

std::string format_cpus(double cpus) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", cpus);
  return buf;
}

std::chrono::milliseconds host_timeout(std::uint64_t seconds) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(seconds) +
                                                               kHostGrace);
}

common::Result<std::filesystem::path> canonical_dir(const std::filesystem::path &path,
                                                    const std::string &label) {
  std::error_code ec;
  auto resolved = std::filesystem::canonical(path, ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure("Invalid " + label + " path: " +
                                                          ec.message());
  }
  return common::Result<std::filesystem::path>::success(std::move(resolved));
}

ExecutionResult finish(const std::string &backend, const ProcessResult &process,
                       std::chrono::steady_clock::time_point started) {
  ExecutionResult result = process.killed
                               ? ExecutionResult::timeout()
                               : ExecutionResult::from_exit(process.exit_code, process.stdout_text,
                                                            process.stderr_text);
  if (process.killed) {
    result.stdout_text = process.stdout_text;
  }
  observability::record_sandbox_run(
      backend, result.exit_code, result.timed_out,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started));
  return result;
}

} // namespace

NativeSandbox::NativeSandbox(std::shared_ptr<IProcessRunner> runner)
    : runner_(runner ? std::move(runner) : std::make_shared<PosixProcessRunner>()) {}

common::Result<ExecutionResult>
NativeSandbox::execute_with_files(const std::string &command,
                                  const std::filesystem::path &workspace,
                                  const std::optional<std::filesystem::path> &extra_files,
                                  const SandboxConfig &config) {
  const std::uint64_t timeout = config.timeout_or_default();
  ProcessOptions options;
  options.working_dir = workspace;
  options.timeout = host_timeout(timeout);
  if (extra_files.has_value()) {
    options.env.emplace_back("SKILL_FILES_PATH", extra_files->string());
  }

  const std::vector<std::string> argv = {"timeout", std::to_string(timeout), "bash", "-c",
                                         command};
  const auto started = std::chrono::steady_clock::now();
  auto process = runner_->run(argv, options);
  if (!process.ok()) {
    return common::Result<ExecutionResult>::failure("Failed to execute command: " +
                                                    process.error());
  }
  return common::Result<ExecutionResult>::success(finish("native", process.value(), started));
}

DockerSandbox::DockerSandbox(std::shared_ptr<IProcessRunner> runner, std::string docker_binary,
                             std::string default_image)
    : runner_(runner ? std::move(runner) : std::make_shared<PosixProcessRunner>()),
      docker_binary_(std::move(docker_binary)), default_image_(std::move(default_image)) {}

bool DockerSandbox::is_available() {
  std::lock_guard<std::mutex> lock(probe_mutex_);
  if (available_.has_value()) {
    return *available_;
  }
  ProcessOptions options;
  options.timeout = kProbeTimeout;
  auto probe = runner_->run({docker_binary_, "--version"}, options);
  available_ = probe.ok() && !probe.value().killed && probe.value().exit_code == 0;
  if (!*available_) {
    observability::log_debug("docker not available via '" + docker_binary_ + "'");
  }
  return *available_;
}

std::vector<std::string>
DockerSandbox::build_run_args(const std::string &command, const std::filesystem::path &workspace,
                              const std::optional<std::filesystem::path> &extra_files,
                              const SandboxConfig &config) const {
  const std::string image =
      config.image.has_value() && !common::trim(*config.image).empty()
          ? resolve_image(*config.image)
          : default_image_;

  std::vector<std::string> args = {
      "run",
      "--rm",
      "--memory=" + config.memory_or_default(),
      "--cpus=" + format_cpus(config.cpu_or_default()),
  };
  if (!config.network_or_default()) {
    args.emplace_back("--network=none");
  }
  args.emplace_back("--read-only");
  args.emplace_back("--tmpfs=/tmp:size=64m");
  args.emplace_back("-v");
  args.emplace_back(workspace.string() + ":" + kWorkspaceMount + ":rw");
  if (extra_files.has_value()) {
    args.emplace_back("-v");
    args.emplace_back(extra_files->string() + ":" + kSkillMount + ":ro");
  }
  args.emplace_back("-w");
  args.emplace_back(kWorkspaceMount);
  args.push_back(image);
  // `timeout` wraps the whole shell so compound commands and builtins stay bounded.
  args.emplace_back("timeout");
  args.push_back(std::to_string(config.timeout_or_default()));
  args.emplace_back("/bin/sh");
  args.emplace_back("-c");
  args.push_back(command);
  return args;
}

common::Result<ExecutionResult>
DockerSandbox::execute_with_files(const std::string &command,
                                  const std::filesystem::path &workspace,
                                  const std::optional<std::filesystem::path> &extra_files,
                                  const SandboxConfig &config) {
  if (!is_available()) {
    return common::Result<ExecutionResult>::failure("Docker is not available");
  }

  auto workspace_abs = canonical_dir(workspace, "workspace");
  if (!workspace_abs.ok()) {
    return common::Result<ExecutionResult>::failure(workspace_abs.error());
  }
  std::optional<std::filesystem::path> extra_abs;
  if (extra_files.has_value()) {
    auto resolved = canonical_dir(*extra_files, "extra files");
    if (!resolved.ok()) {
      return common::Result<ExecutionResult>::failure(resolved.error());
    }
    extra_abs = resolved.value();
  }

  std::vector<std::string> argv = {docker_binary_};
  for (auto &arg : build_run_args(command, workspace_abs.value(), extra_abs, config)) {
    argv.push_back(std::move(arg));
  }
  observability::log_debug("docker " + join_args({argv.begin() + 1, argv.end()}));

  ProcessOptions options;
  options.timeout = host_timeout(config.timeout_or_default());
  const auto started = std::chrono::steady_clock::now();
  auto process = runner_->run(argv, options);
  if (!process.ok()) {
    return common::Result<ExecutionResult>::failure("Failed to run docker: " + process.error());
  }
  return common::Result<ExecutionResult>::success(finish("docker", process.value(), started));
}

common::Result<ExecutionResult>
DockerSandbox::execute_python(const std::string &script, const std::filesystem::path &workspace,
                              const std::filesystem::path &skill_dir,
                              const SandboxConfig &config) {
  return execute_with_files("python3 " + std::string(kSkillMount) + "/" + script, workspace,
                            skill_dir, config);
}

common::Result<ExecutionResult>
DockerSandbox::execute_shell(const std::string &script, const std::filesystem::path &workspace,
                             const std::filesystem::path &skill_dir, const SandboxConfig &config) {
  return execute_with_files("sh " + std::string(kSkillMount) + "/" + script, workspace, skill_dir,
                            config);
}

common::Result<ExecutionResult>
DockerSandbox::execute_node(const std::string &script, const std::filesystem::path &workspace,
                            const std::filesystem::path &skill_dir, SandboxConfig config) {
  if (!config.image.has_value()) {
    config.image = "node:20-slim";
  }
  return execute_with_files("node " + std::string(kSkillMount) + "/" + script, workspace,
                            skill_dir, config);
}

SandboxConfig config_from_settings(const config::SandboxSettings &settings) {
  SandboxConfig config;
  if (!common::trim(settings.image).empty()) {
    config.image = common::trim(settings.image);
  }
  config.memory_limit = settings.memory_limit;
  config.cpu_limit = settings.cpu_limit;
  config.timeout_seconds = settings.timeout_seconds;
  config.network_enabled = settings.network_enabled;
  return config;
}

common::Result<std::shared_ptr<ISandbox>> create_sandbox(config::ExecutionMode mode,
                                                         std::shared_ptr<DockerSandbox> docker,
                                                         std::shared_ptr<NativeSandbox> native) {
  using ResultT = common::Result<std::shared_ptr<ISandbox>>;
  if (!docker) {
    docker = std::make_shared<DockerSandbox>();
  }
  if (!native) {
    native = std::make_shared<NativeSandbox>();
  }

  switch (mode) {
  case config::ExecutionMode::Sandbox:
    if (!docker->is_available()) {
      return ResultT::failure("Docker is required for sandbox mode but is not available");
    }
    return ResultT::success(docker);
  case config::ExecutionMode::Direct:
    return ResultT::success(native);
  case config::ExecutionMode::Flexible:
    if (docker->is_available()) {
      return ResultT::success(docker);
    }
    observability::log_info("docker unavailable, using native execution");
    return ResultT::success(native);
  }
  return ResultT::success(native);
}

} // namespace cowork::sandbox
