#pragma once

#include "cowork/common/result.hpp"
#include "cowork/config/schema.hpp"
#include "cowork/sandbox/process.hpp"
#include "cowork/sandbox/types.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cowork::sandbox {

/// Runs a shell command against a workspace under resource limits. A command that fails or
/// times out is a successful call with a failed ExecutionResult; the call itself fails only
/// when the backend cannot run anything.
class ISandbox {
public:
  virtual ~ISandbox() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual bool is_available() = 0;

  [[nodiscard]] virtual common::Result<ExecutionResult>
  execute(const std::string &command, const std::filesystem::path &workspace,
          const SandboxConfig &config) {
    return execute_with_files(command, workspace, std::nullopt, config);
  }

  /// `extra_files` is a read-only code bundle made available next to the workspace.
  [[nodiscard]] virtual common::Result<ExecutionResult>
  execute_with_files(const std::string &command, const std::filesystem::path &workspace,
                     const std::optional<std::filesystem::path> &extra_files,
                     const SandboxConfig &config) = 0;
};

/// Host process backend. No isolation.
class NativeSandbox final : public ISandbox {
public:
  explicit NativeSandbox(std::shared_ptr<IProcessRunner> runner = nullptr);

  [[nodiscard]] std::string_view name() const override { return "native"; }
  [[nodiscard]] bool is_available() override { return true; }

  [[nodiscard]] common::Result<ExecutionResult>
  execute_with_files(const std::string &command, const std::filesystem::path &workspace,
                     const std::optional<std::filesystem::path> &extra_files,
                     const SandboxConfig &config) override;

private:
  std::shared_ptr<IProcessRunner> runner_;
};

/// Container backend driven through the docker CLI.
class DockerSandbox final : public ISandbox {
public:
  static constexpr const char *kDefaultImage = "python:3.11-slim";
  static constexpr const char *kWorkspaceMount = "/workspace";
  static constexpr const char *kSkillMount = "/skill";

  explicit DockerSandbox(std::shared_ptr<IProcessRunner> runner = nullptr,
                         std::string docker_binary = "docker",
                         std::string default_image = kDefaultImage);

  [[nodiscard]] std::string_view name() const override { return "docker"; }

  /// `docker --version` succeeds. Probed once and cached.
  [[nodiscard]] bool is_available() override;

  [[nodiscard]] common::Result<ExecutionResult>
  execute_with_files(const std::string &command, const std::filesystem::path &workspace,
                     const std::optional<std::filesystem::path> &extra_files,
                     const SandboxConfig &config) override;

  [[nodiscard]] common::Result<ExecutionResult>
  execute_python(const std::string &script, const std::filesystem::path &workspace,
                 const std::filesystem::path &skill_dir, const SandboxConfig &config);
  [[nodiscard]] common::Result<ExecutionResult>
  execute_shell(const std::string &script, const std::filesystem::path &workspace,
                const std::filesystem::path &skill_dir, const SandboxConfig &config);
  [[nodiscard]] common::Result<ExecutionResult>
  execute_node(const std::string &script, const std::filesystem::path &workspace,
               const std::filesystem::path &skill_dir, SandboxConfig config);

  /// Arguments after the docker binary for a prepared invocation. Paths must be absolute.
  [[nodiscard]] std::vector<std::string>
  build_run_args(const std::string &command, const std::filesystem::path &workspace,
                 const std::optional<std::filesystem::path> &extra_files,
                 const SandboxConfig &config) const;

private:
  std::shared_ptr<IProcessRunner> runner_;
  std::string docker_binary_;
  std::string default_image_;
  std::mutex probe_mutex_;
  std::optional<bool> available_;
};

/// Session-wide limits from the `[sandbox]` section. An empty image stays unset so the
/// backend's own default applies.
[[nodiscard]] SandboxConfig config_from_settings(const config::SandboxSettings &settings);

/// sandbox -> docker, failing when docker is missing; direct -> native;
/// flexible -> docker when available, else native.
[[nodiscard]] common::Result<std::shared_ptr<ISandbox>>
create_sandbox(config::ExecutionMode mode, std::shared_ptr<DockerSandbox> docker = nullptr,
               std::shared_ptr<NativeSandbox> native = nullptr);

} // namespace cowork::sandbox
