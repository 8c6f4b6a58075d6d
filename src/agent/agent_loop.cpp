#include "cowork/agent/agent_loop.hpp"

#include "cowork/agent/tool_call.hpp"
#include "cowork/observability/global.hpp"
#include "cowork/observability/log.hpp"

#include <chrono>

namespace cowork::agent {

namespace {

std::string format_tool_feedback(const std::string &tool_name, const tools::ToolResult &result) {
  if (result.success) {
    return "Tool '" + tool_name + "' returned:\n" + result.output;
  }
  return "Tool '" + tool_name + "' failed:\n" + result.output;
}

} // namespace

std::string_view to_string(const LoopStop stop) {
  switch (stop) {
  case LoopStop::Answered:
    return "answered";
  case LoopStop::BudgetExhausted:
    return "budget_exhausted";
  case LoopStop::ProviderError:
    return "provider_error";
  case LoopStop::FatalToolError:
    return "fatal_tool_error";
  }
  return "answered";
}

AgentLoop::AgentLoop(std::shared_ptr<providers::Provider> provider,
                     const tools::ToolRegistry &tools, tools::ToolContext context,
                     std::shared_ptr<events::IEventSink> sink, LoopOptions options)
    : provider_(std::move(provider)), tools_(tools), context_(std::move(context)),
      sink_(std::move(sink)), options_(std::move(options)),
      channel_(events::session_channel(context_.session_id)) {}

void AgentLoop::emit(const events::AgentEvent &event) const {
  if (sink_) {
    sink_->emit(channel_, event);
  }
}

std::string AgentLoop::build_preamble() const {
  std::string preamble = options_.system_prompt;
  if (!preamble.empty()) {
    preamble += "\n\n";
  }
  preamble += "Workspace: " + context_.workspace_path.string() + "\n\n";
  preamble += tools_.render_prompt();
  return preamble;
}

LoopOutcome AgentLoop::run(const std::string &task, events::ExecutionJob &job,
                           ConversationHistory &history) {
  const auto started = std::chrono::steady_clock::now();
  const auto elapsed = [&started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 started);
  };
  observability::record_agent_start(provider_->name(), options_.model);

  providers::ChatRequest request;
  request.preamble = build_preamble();
  request.model = options_.model;
  request.temperature = options_.temperature;

  history.append_user(task);
  LoopOutcome outcome;

  while (true) {
    request.history = history.messages();
    const auto asked = std::chrono::steady_clock::now();
    auto reply = provider_->chat(request);
    observability::record_metric(observability::LlmLatencyMetric{
        .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - asked)});
    if (!reply.ok()) {
      observability::log_error("completion failed: " + reply.error());
      observability::record_error("agent_loop", reply.error());
      emit(events::Error{.message = "Chat error: " + reply.error(), .error = reply.error()});
      outcome.stop = LoopStop::ProviderError;
      outcome.text = reply.error();
      break;
    }
    const std::string &text = reply.value();
    auto call = parse_tool_call(text);
    history.append_assistant(text);

    if (!call.has_value()) {
      emit(events::Token{.content = text});
      outcome.stop = LoopStop::Answered;
      outcome.text = text;
      break;
    }

    if (outcome.steps >= options_.max_steps) {
      outcome.stop = LoopStop::BudgetExhausted;
      outcome.text = "Stopped after reaching the limit of " + std::to_string(options_.max_steps) +
                     " tool steps";
      observability::log_warn(outcome.text);
      emit(events::Error{.message = outcome.text, .error = std::nullopt});
      break;
    }

    ++outcome.steps;
    emit(events::Thinking{.message = "Using tool: " + call->name});
    auto step = execute_step(call->name, call->arguments, call->raw_arguments, job);
    history.append_tool(std::move(step.feedback));
    if (step.fatal) {
      outcome.stop = LoopStop::FatalToolError;
      outcome.text = history.messages().back().content;
      emit(events::Error{.message = outcome.text, .error = std::nullopt});
      break;
    }
  }

  observability::record_agent_end(elapsed(), outcome.success());
  return outcome;
}

AgentLoop::StepOutcome AgentLoop::execute_step(const std::string &tool_name,
                                               const tools::ToolArgs &args,
                                               const std::string &raw_args,
                                               events::ExecutionJob &job) {
  auto step = events::ToolStep::create(tool_name, raw_args);
  step.status = events::StepStatus::Executing;
  tools::ITool *tool = tools_.get_tool(tool_name);
  step.requires_approval = tool != nullptr && tool->requires_approval(args);
  const std::size_t index = job.append_step(step);
  job.current_step_index = index;
  emit(events::StepStarted{.job = job, .step = step});
  if (step.requires_approval) {
    step.status = events::StepStatus::WaitingApproval;
    job.steps[index] = step;
    emit(events::ApprovalRequired{.job = job, .step = step});
  }

  tools::ToolResult result;
  const auto started = std::chrono::steady_clock::now();
  if (tool == nullptr) {
    result = tools::ToolResult::error(tools::ToolErrorKind::Other, "Unknown tool: " + tool_name);
  } else {
    auto executed = tool->execute(args, context_);
    result = executed.ok() ? std::move(executed.value())
                           : tools::ToolResult::error(tools::ToolErrorKind::ExecutionFailed,
                                                      executed.error());
  }
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_tool_call(tool_name, duration, result.success);

  if (step.requires_approval) {
    if (result.error_kind == tools::ToolErrorKind::PermissionDenied) {
      step.status = events::StepStatus::Skipped;
      job.steps[index] = step;
      emit(events::StepRejected{.job = job, .step = step});
    } else {
      step.status = events::StepStatus::Executing;
      job.steps[index] = step;
      emit(events::StepApproved{.job = job, .step = step});
    }
  }

  const std::size_t full_size = result.output.size();
  if (tool != nullptr && tool->needs_summarization(args, result)) {
    observability::log_debug("tool " + tool_name + " produced " + std::to_string(full_size) +
                             " chars");
  }
  std::string output = truncate_result(result.output, options_.max_result_chars);
  result.truncated = result.truncated || output.size() != full_size;
  result.output = std::move(output);

  if (step.status != events::StepStatus::Skipped) {
    step.status = result.success ? events::StepStatus::Completed : events::StepStatus::Failed;
  }
  step.result = result.output;
  job.steps[index] = step;
  emit(events::StepCompleted{.job = job, .step = step});

  const bool fatal = !result.success && tools::is_fatal(result.error_kind);
  if (!result.success) {
    observability::log_warn("tool " + tool_name + " failed (" +
                            std::string(tools::to_string(result.error_kind)) +
                            "): " + result.output);
  }
  return StepOutcome{.feedback = format_tool_feedback(tool_name, result), .fatal = fatal};
}

} // namespace cowork::agent
