#pragma once

#include "cowork/agent/agent_loop.hpp"
#include "cowork/agent/history.hpp"
#include "cowork/agent/planner.hpp"
#include "cowork/agent/router.hpp"
#include "cowork/config/schema.hpp"
#include "cowork/events/channel.hpp"
#include "cowork/providers/reliable.hpp"
#include "cowork/store/job_store.hpp"
#include "cowork/tools/tool_registry.hpp"

#include <memory>
#include <string>

namespace cowork::agent {

/// Smart routes through the classifier and planner; Fast runs the loop on the message as is.
enum class RunMode { Smart, Fast };

[[nodiscard]] std::string_view to_string(RunMode mode);
[[nodiscard]] common::Result<RunMode> run_mode_from_string(const std::string &value);

struct CoordinatorDependencies {
  std::shared_ptr<providers::Provider> provider;
  std::shared_ptr<tools::ToolRegistry> tools;
  std::shared_ptr<events::IEventSink> sink;
  std::shared_ptr<permissions::PermissionManager> permissions;
  std::shared_ptr<sandbox::ISandbox> sandbox;
  /// Optional. Jobs and transcript are persisted when set.
  std::shared_ptr<store::IJobStore> store;
  /// Planner backoff; real sleeping when empty.
  providers::SleepFn sleep;
};

struct RunResult {
  events::ExecutionJob job;
  std::string message;

  [[nodiscard]] bool success() const { return job.status == events::JobStatus::Completed; }
};

/// One per session. Sequences classification, direct chat or plan-and-execute, and reports
/// the job lifecycle on `session:<id>`.
class Coordinator {
public:
  Coordinator(const config::Config &config, std::string session_id,
              CoordinatorDependencies dependencies);

  [[nodiscard]] RunResult run(const std::string &message, RunMode mode = RunMode::Smart);

  /// Seeds the conversation from the store's transcript for this session.
  [[nodiscard]] common::Status restore_history();

  [[nodiscard]] const std::string &session_id() const { return session_id_; }
  [[nodiscard]] const ConversationHistory &history() const { return history_; }

private:
  [[nodiscard]] RunResult run_fast(events::ExecutionJob job, const std::string &message);
  [[nodiscard]] RunResult run_simple(events::ExecutionJob job, const std::string &message);
  [[nodiscard]] RunResult run_planned(events::ExecutionJob job, const std::string &message);

  [[nodiscard]] AgentLoop make_loop() const;
  [[nodiscard]] RunResult finish(events::ExecutionJob job, events::JobStatus status,
                                 std::string message);
  void emit(const events::AgentEvent &event) const;
  void persist_message(const std::string &role, const std::string &content) const;

  const config::Config &config_;
  std::string session_id_;
  CoordinatorDependencies deps_;
  std::string channel_;
  ConversationHistory history_;
};

} // namespace cowork::agent
