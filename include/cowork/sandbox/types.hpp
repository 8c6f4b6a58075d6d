#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cowork::sandbox {

/// Exit status `timeout(1)` reports when it had to stop the command.
inline constexpr int kTimeoutExitCode = 124;

/// Per-invocation limits. Unset fields fall back to the defaults below.
struct SandboxConfig {
  std::optional<std::string> image;
  std::optional<std::string> memory_limit;
  std::optional<double> cpu_limit;
  std::optional<std::uint64_t> timeout_seconds;
  std::optional<bool> network_enabled;

  static constexpr const char *kDefaultImage = "debian:stable-slim";
  static constexpr const char *kDefaultMemory = "256m";
  static constexpr double kDefaultCpu = 0.5;
  static constexpr std::uint64_t kDefaultTimeoutSeconds = 300;

  /// Every field populated with the defaults.
  [[nodiscard]] static SandboxConfig defaults();
  [[nodiscard]] static SandboxConfig python();
  [[nodiscard]] static SandboxConfig nodejs();

  SandboxConfig &with_image(std::string value);
  SandboxConfig &with_memory_limit(std::string value);
  SandboxConfig &with_cpu_limit(double value);
  SandboxConfig &with_timeout(std::uint64_t seconds);
  SandboxConfig &with_network(bool enabled);

  /// Fields set here win; unset ones are taken from `base`.
  [[nodiscard]] SandboxConfig layered_on(const SandboxConfig &base) const;

  [[nodiscard]] std::string memory_or_default() const;
  [[nodiscard]] double cpu_or_default() const;
  [[nodiscard]] std::uint64_t timeout_or_default() const;
  [[nodiscard]] bool network_or_default() const;
};

struct ExecutionResult {
  bool success = false;
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  bool timed_out = false;

  [[nodiscard]] static ExecutionResult ok(std::string stdout_text);
  [[nodiscard]] static ExecutionResult failure(std::string stderr_text, int exit_code);
  [[nodiscard]] static ExecutionResult timeout();

  /// Classifies a finished command; exit code 124 counts as a timeout.
  [[nodiscard]] static ExecutionResult from_exit(int exit_code, std::string stdout_text,
                                                 std::string stderr_text);
};

/// Container image aliases: python, python:3.11, python311 -> python:3.11-slim;
/// node, node:20, node20 -> node:20-slim; anycowork -> anycowork/skill-runner:latest.
/// Anything else is used verbatim.
[[nodiscard]] std::string resolve_image(const std::string &name);

} // namespace cowork::sandbox
