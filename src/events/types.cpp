#include "cowork/events/types.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/ids.hpp"
#include "cowork/common/json_util.hpp"

#include <sstream>
#include <type_traits>

namespace cowork::events {

namespace {

std::string raw_json_or_string(const std::string &value) {
  return common::json_is_object(value) ? common::trim(value) : common::json_quote(value);
}

std::string job_step_payload(const ExecutionJob &job, const ToolStep &step) {
  return ",\"job\":" + job.to_json() + ",\"step\":" + step.to_json();
}

} // namespace

std::string_view to_string(StepStatus status) {
  switch (status) {
  case StepStatus::Pending:
    return "pending";
  case StepStatus::Executing:
    return "executing";
  case StepStatus::WaitingApproval:
    return "waiting_approval";
  case StepStatus::Completed:
    return "completed";
  case StepStatus::Failed:
    return "failed";
  case StepStatus::Skipped:
    return "skipped";
  }
  return "pending";
}

std::string_view to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Running:
    return "running";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Failed:
    return "failed";
  }
  return "running";
}

std::string_view to_string(TaskStatus status) {
  switch (status) {
  case TaskStatus::Pending:
    return "pending";
  case TaskStatus::Running:
    return "running";
  case TaskStatus::Completed:
    return "completed";
  }
  return "pending";
}

StepStatus step_status_from_string(const std::string &value) {
  for (const auto status :
       {StepStatus::Pending, StepStatus::Executing, StepStatus::WaitingApproval,
        StepStatus::Completed, StepStatus::Failed, StepStatus::Skipped}) {
    if (to_string(status) == value) {
      return status;
    }
  }
  return StepStatus::Pending;
}

JobStatus job_status_from_string(const std::string &value) {
  if (value == "completed") {
    return JobStatus::Completed;
  }
  if (value == "failed") {
    return JobStatus::Failed;
  }
  return JobStatus::Running;
}

ToolStep ToolStep::create(std::string tool_name, std::string tool_args) {
  ToolStep step;
  step.id = common::new_uuid();
  step.tool_name = std::move(tool_name);
  step.tool_args = std::move(tool_args);
  step.created_at = common::now_rfc3339();
  return step;
}

std::string ToolStep::to_json() const {
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(id) << ",\"tool_name\":" << common::json_quote(tool_name)
      << ",\"tool_args\":" << raw_json_or_string(tool_args)
      << ",\"status\":" << common::json_quote(std::string(to_string(status)))
      << ",\"result\":" << (result.has_value() ? common::json_quote(*result) : "null")
      << ",\"requires_approval\":" << (requires_approval ? "true" : "false")
      << ",\"created_at\":" << common::json_quote(created_at) << "}";
  return out.str();
}

ExecutionJob ExecutionJob::create(std::string session_id, std::string query) {
  ExecutionJob job;
  job.id = common::new_uuid();
  job.session_id = std::move(session_id);
  job.query = std::move(query);
  job.created_at = common::now_rfc3339();
  return job;
}

std::size_t ExecutionJob::append_step(ToolStep step) {
  steps.push_back(std::move(step));
  current_step_index = steps.size() - 1;
  return current_step_index;
}

ExecutionJob ExecutionJob::with_status(JobStatus next) const {
  ExecutionJob copy = *this;
  copy.status = next;
  return copy;
}

std::string ExecutionJob::to_json() const {
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(id) << ",\"session_id\":" << common::json_quote(session_id)
      << ",\"status\":" << common::json_quote(std::string(to_string(status)))
      << ",\"query\":" << common::json_quote(query) << ",\"steps\":[";
  for (std::size_t i = 0; i < steps.size(); ++i) {
    out << (i == 0 ? "" : ",") << steps[i].to_json();
  }
  out << "],\"current_step_index\":" << current_step_index
      << ",\"created_at\":" << common::json_quote(created_at) << "}";
  return out.str();
}

bool Plan::start_task(std::size_t index) {
  if (index >= tasks.size() || tasks[index].status != TaskStatus::Pending) {
    return false;
  }
  tasks[index].status = TaskStatus::Running;
  return true;
}

bool Plan::complete_task(std::size_t index, std::optional<std::string> result) {
  if (index >= tasks.size() || tasks[index].status != TaskStatus::Running) {
    return false;
  }
  tasks[index].status = TaskStatus::Completed;
  tasks[index].result = std::move(result);
  return true;
}

std::string Plan::to_json() const {
  std::ostringstream out;
  out << "{\"plan_id\":" << common::json_quote(id) << ",\"objective\":" << common::json_quote(objective)
      << ",\"tasks\":[";
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    const auto &task = tasks[i];
    out << (i == 0 ? "" : ",") << "{\"task_id\":" << common::json_quote(task.id)
        << ",\"description\":" << common::json_quote(task.description)
        << ",\"status\":" << common::json_quote(std::string(to_string(task.status)))
        << ",\"result\":" << (task.result.has_value() ? common::json_quote(*task.result) : "null")
        << "}";
  }
  out << "]}";
  return out.str();
}

std::string_view event_type(const AgentEvent &event) {
  return std::visit(
      [](auto &&evt) -> std::string_view {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, Token>) {
          return "token";
        } else if constexpr (std::is_same_v<T, JobStarted>) {
          return "job_started";
        } else if constexpr (std::is_same_v<T, JobCompleted>) {
          return "job_completed";
        } else if constexpr (std::is_same_v<T, StepStarted>) {
          return "step_started";
        } else if constexpr (std::is_same_v<T, StepCompleted>) {
          return "step_completed";
        } else if constexpr (std::is_same_v<T, ApprovalRequired>) {
          return "approval_required";
        } else if constexpr (std::is_same_v<T, StepApproved>) {
          return "step_approved";
        } else if constexpr (std::is_same_v<T, StepRejected>) {
          return "step_rejected";
        } else if constexpr (std::is_same_v<T, Thinking>) {
          return "thinking";
        } else if constexpr (std::is_same_v<T, Error>) {
          return "error";
        } else if constexpr (std::is_same_v<T, PlanUpdate>) {
          return "plan_update";
        } else {
          return "permission_request";
        }
      },
      event);
}

std::string to_json(const AgentEvent &event) {
  const std::string head = "{\"type\":" + common::json_quote(std::string(event_type(event)));
  const std::string body = std::visit(
      [](auto &&evt) -> std::string {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, Token>) {
          return ",\"content\":" + common::json_quote(evt.content);
        } else if constexpr (std::is_same_v<T, JobStarted>) {
          return ",\"job\":" + evt.job.to_json();
        } else if constexpr (std::is_same_v<T, JobCompleted>) {
          return ",\"job\":" + evt.job.to_json() + ",\"message\":" + common::json_quote(evt.message);
        } else if constexpr (std::is_same_v<T, Thinking>) {
          return ",\"message\":" + common::json_quote(evt.message);
        } else if constexpr (std::is_same_v<T, Error>) {
          return ",\"message\":" + common::json_quote(evt.message) + ",\"error\":" +
                 (evt.error.has_value() ? common::json_quote(*evt.error) : std::string("null"));
        } else if constexpr (std::is_same_v<T, PlanUpdate>) {
          return ",\"plan\":" + evt.plan.to_json();
        } else if constexpr (std::is_same_v<T, PermissionRequested>) {
          return ",\"request\":" + evt.request.to_json();
        } else {
          return job_step_payload(evt.job, evt.step);
        }
      },
      event);
  return head + body + "}";
}

} // namespace cowork::events
