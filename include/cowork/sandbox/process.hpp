#pragma once

#include "cowork/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace cowork::sandbox {

struct ProcessOptions {
  std::filesystem::path working_dir;
  std::vector<std::pair<std::string, std::string>> env;
  std::chrono::milliseconds timeout{30'000};
  std::size_t max_output_bytes = 1024 * 1024;
};

struct ProcessResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool killed = false;
  bool output_truncated = false;
};

/// Spawns a program and collects its output. A non-zero exit is not an error; failing to
/// spawn is.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  [[nodiscard]] virtual common::Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                          const ProcessOptions &options) = 0;
};

/// fork/execvp with separate stdout and stderr pipes. The child leads its own process group
/// so a host-side timeout can kill the whole tree.
class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] common::Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                  const ProcessOptions &options) override;
};

[[nodiscard]] std::string join_args(const std::vector<std::string> &args);

} // namespace cowork::sandbox
