#pragma once

#include "cowork/permissions/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cowork::events {

enum class StepStatus { Pending, Executing, WaitingApproval, Completed, Failed, Skipped };
enum class JobStatus { Running, Completed, Failed };
enum class TaskStatus { Pending, Running, Completed };

[[nodiscard]] std::string_view to_string(StepStatus status);
[[nodiscard]] std::string_view to_string(JobStatus status);
[[nodiscard]] std::string_view to_string(TaskStatus status);
[[nodiscard]] StepStatus step_status_from_string(const std::string &value);
[[nodiscard]] JobStatus job_status_from_string(const std::string &value);

/// One tool invocation inside a job.
struct ToolStep {
  std::string id;
  std::string tool_name;
  std::string tool_args = "{}"; // raw JSON
  StepStatus status = StepStatus::Pending;
  std::optional<std::string> result;
  bool requires_approval = false;
  std::string created_at;

  [[nodiscard]] static ToolStep create(std::string tool_name, std::string tool_args);
  [[nodiscard]] std::string to_json() const;
};

/// One end-to-end response to a user message. Steps are append-only.
struct ExecutionJob {
  std::string id;
  std::string session_id;
  JobStatus status = JobStatus::Running;
  std::string query;
  std::vector<ToolStep> steps;
  std::size_t current_step_index = 0;
  std::string created_at;

  [[nodiscard]] static ExecutionJob create(std::string session_id, std::string query);

  /// Appends and returns the index of the new step.
  std::size_t append_step(ToolStep step);
  [[nodiscard]] ExecutionJob with_status(JobStatus next) const;
  [[nodiscard]] std::string to_json() const;
};

struct Task {
  std::string id;
  std::string description;
  TaskStatus status = TaskStatus::Pending;
  std::optional<std::string> result;
};

/// Ordered decomposition of an objective. Task status only moves forward.
struct Plan {
  std::string id;
  std::string objective;
  std::vector<Task> tasks;

  /// pending -> running; false if the index is invalid or the task already left pending.
  bool start_task(std::size_t index);
  /// running -> completed.
  bool complete_task(std::size_t index, std::optional<std::string> result = std::nullopt);

  [[nodiscard]] std::string to_json() const;
};

struct Token {
  std::string content;
};
struct JobStarted {
  ExecutionJob job;
};
struct JobCompleted {
  ExecutionJob job;
  std::string message;
};
struct StepStarted {
  ExecutionJob job;
  ToolStep step;
};
struct StepCompleted {
  ExecutionJob job;
  ToolStep step;
};
struct ApprovalRequired {
  ExecutionJob job;
  ToolStep step;
};
struct StepApproved {
  ExecutionJob job;
  ToolStep step;
};
struct StepRejected {
  ExecutionJob job;
  ToolStep step;
};
struct Thinking {
  std::string message;
};
struct Error {
  std::string message;
  std::optional<std::string> error;
};
struct PlanUpdate {
  Plan plan;
};
struct PermissionRequested {
  permissions::PermissionRequest request;
};

using AgentEvent =
    std::variant<Token, JobStarted, JobCompleted, StepStarted, StepCompleted, ApprovalRequired,
                 StepApproved, StepRejected, Thinking, Error, PlanUpdate, PermissionRequested>;

/// snake_case tag, e.g. "job_started".
[[nodiscard]] std::string_view event_type(const AgentEvent &event);

/// JSON object with a `type` field plus the variant payload.
[[nodiscard]] std::string to_json(const AgentEvent &event);

} // namespace cowork::events
