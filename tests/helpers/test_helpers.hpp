#pragma once

#include "cowork/config/schema.hpp"
#include "cowork/events/channel.hpp"
#include "cowork/providers/traits.hpp"
#include "cowork/sandbox/process.hpp"
#include "cowork/sandbox/sandbox.hpp"

#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cowork::testing {

/// Replies in order; runs out with an error. Every request is kept for inspection.
class ScriptedProvider final : public providers::Provider {
public:
  ScriptedProvider() = default;
  explicit ScriptedProvider(std::vector<std::string> replies);

  void push_reply(std::string reply);
  void push_error(std::string error_message);

  [[nodiscard]] common::Result<std::string> chat(const providers::ChatRequest &request) override;
  [[nodiscard]] std::string name() const override { return "scripted"; }

  [[nodiscard]] const std::vector<providers::ChatRequest> &requests() const { return requests_; }

private:
  std::deque<common::Result<std::string>> replies_;
  std::vector<providers::ChatRequest> requests_;
};

class RecordingSink final : public events::IEventSink {
public:
  void emit(const std::string &channel, const events::AgentEvent &event) override;

  [[nodiscard]] std::vector<std::pair<std::string, events::AgentEvent>> events() const;
  /// event_type() of every event, in order.
  [[nodiscard]] std::vector<std::string> types() const;
  [[nodiscard]] std::size_t count(const std::string &type) const;

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, events::AgentEvent>> events_;
};

class FakeProcessRunner final : public sandbox::IProcessRunner {
public:
  sandbox::ProcessResult next;
  std::optional<std::string> next_error;
  std::vector<std::vector<std::string>> calls;
  std::vector<sandbox::ProcessOptions> options;

  [[nodiscard]] common::Result<sandbox::ProcessResult> run(const std::vector<std::string> &argv,
                                                           const sandbox::ProcessOptions &opts) override;
};

class FakeSandbox final : public sandbox::ISandbox {
public:
  explicit FakeSandbox(std::string name = "fake", bool available = true);

  sandbox::ExecutionResult next = sandbox::ExecutionResult::ok("");
  std::vector<std::string> commands;
  std::vector<std::optional<std::filesystem::path>> extra_files;
  std::vector<sandbox::SandboxConfig> configs;

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] bool is_available() override { return available_; }

  [[nodiscard]] common::Result<sandbox::ExecutionResult>
  execute_with_files(const std::string &command, const std::filesystem::path &workspace,
                     const std::optional<std::filesystem::path> &extra_files_dir,
                     const sandbox::SandboxConfig &config) override;

private:
  std::string name_;
  bool available_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Settings pointed at `workspace` with observability off and a store inside it.
config::Config temp_config(const TempWorkspace &workspace);

} // namespace cowork::testing
