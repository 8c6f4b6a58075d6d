#include "cowork/sandbox/types.hpp"

#include "cowork/common/fs.hpp"

namespace cowork::sandbox {

SandboxConfig SandboxConfig::defaults() {
  SandboxConfig config;
  config.image = kDefaultImage;
  config.memory_limit = kDefaultMemory;
  config.cpu_limit = kDefaultCpu;
  config.timeout_seconds = kDefaultTimeoutSeconds;
  config.network_enabled = false;
  return config;
}

SandboxConfig SandboxConfig::python() {
  auto config = defaults();
  config.image = "python:3.11-slim";
  return config;
}

SandboxConfig SandboxConfig::nodejs() {
  auto config = defaults();
  config.image = "node:20-slim";
  return config;
}

SandboxConfig &SandboxConfig::with_image(std::string value) {
  image = std::move(value);
  return *this;
}

SandboxConfig &SandboxConfig::with_memory_limit(std::string value) {
  memory_limit = std::move(value);
  return *this;
}

SandboxConfig &SandboxConfig::with_cpu_limit(double value) {
  cpu_limit = value;
  return *this;
}

SandboxConfig &SandboxConfig::with_timeout(std::uint64_t seconds) {
  timeout_seconds = seconds;
  return *this;
}

SandboxConfig &SandboxConfig::with_network(bool enabled) {
  network_enabled = enabled;
  return *this;
}

SandboxConfig SandboxConfig::layered_on(const SandboxConfig &base) const {
  SandboxConfig out = base;
  if (image.has_value()) {
    out.image = image;
  }
  if (memory_limit.has_value()) {
    out.memory_limit = memory_limit;
  }
  if (cpu_limit.has_value()) {
    out.cpu_limit = cpu_limit;
  }
  if (timeout_seconds.has_value()) {
    out.timeout_seconds = timeout_seconds;
  }
  if (network_enabled.has_value()) {
    out.network_enabled = network_enabled;
  }
  return out;
}

std::string SandboxConfig::memory_or_default() const {
  return memory_limit.value_or(kDefaultMemory);
}

double SandboxConfig::cpu_or_default() const { return cpu_limit.value_or(kDefaultCpu); }

std::uint64_t SandboxConfig::timeout_or_default() const {
  return timeout_seconds.value_or(kDefaultTimeoutSeconds);
}

bool SandboxConfig::network_or_default() const { return network_enabled.value_or(false); }

ExecutionResult ExecutionResult::ok(std::string stdout_text) {
  ExecutionResult result;
  result.success = true;
  result.stdout_text = std::move(stdout_text);
  result.exit_code = 0;
  return result;
}

ExecutionResult ExecutionResult::failure(std::string stderr_text, int exit_code) {
  ExecutionResult result;
  result.stderr_text = std::move(stderr_text);
  result.exit_code = exit_code;
  return result;
}

ExecutionResult ExecutionResult::timeout() {
  ExecutionResult result;
  result.stderr_text = "Command timed out";
  result.exit_code = kTimeoutExitCode;
  result.timed_out = true;
  return result;
}

ExecutionResult ExecutionResult::from_exit(int exit_code, std::string stdout_text,
                                           std::string stderr_text) {
  ExecutionResult result;
  result.success = exit_code == 0;
  result.exit_code = exit_code;
  result.timed_out = exit_code == kTimeoutExitCode;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  return result;
}

std::string resolve_image(const std::string &name) {
  const std::string key = common::to_lower(common::trim(name));
  if (key == "python" || key == "python:3.11" || key == "python311") {
    return "python:3.11-slim";
  }
  if (key == "node" || key == "node:20" || key == "node20") {
    return "node:20-slim";
  }
  if (key == "anycowork") {
    return "anycowork/skill-runner:latest";
  }
  return common::trim(name);
}

} // namespace cowork::sandbox
