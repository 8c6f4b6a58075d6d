#include "cowork/agent/coordinator.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/config/config.hpp"
#include "cowork/observability/log.hpp"

namespace cowork::agent {

std::string_view to_string(const RunMode mode) { return mode == RunMode::Fast ? "fast" : "smart"; }

common::Result<RunMode> run_mode_from_string(const std::string &value) {
  const std::string lower = common::to_lower(common::trim(value));
  if (lower == "fast") {
    return common::Result<RunMode>::success(RunMode::Fast);
  }
  if (lower == "smart" || lower.empty()) {
    return common::Result<RunMode>::success(RunMode::Smart);
  }
  return common::Result<RunMode>::failure("Unknown run mode: " + value);
}

Coordinator::Coordinator(const config::Config &config, std::string session_id,
                         CoordinatorDependencies dependencies)
    : config_(config), session_id_(std::move(session_id)), deps_(std::move(dependencies)),
      channel_(events::session_channel(session_id_)),
      history_(config.history.max_history_chars) {}

void Coordinator::emit(const events::AgentEvent &event) const {
  if (deps_.sink) {
    deps_.sink->emit(channel_, event);
  }
}

void Coordinator::persist_message(const std::string &role, const std::string &content) const {
  if (!deps_.store) {
    return;
  }
  if (auto saved = deps_.store->append_message(session_id_, role, content); !saved.ok()) {
    observability::log_warn("failed to persist " + role + " message: " + saved.error());
  }
}

common::Status Coordinator::restore_history() {
  if (!deps_.store) {
    return common::Status::success();
  }
  auto messages = deps_.store->list_messages(session_id_);
  if (!messages.ok()) {
    return common::Status::error(messages.error());
  }
  history_.clear();
  for (const auto &message : messages.value()) {
    if (message.role == "user" || message.role == "assistant") {
      history_.append(providers::ChatMessage{message.role, message.content});
    }
  }
  return common::Status::success();
}

AgentLoop Coordinator::make_loop() const {
  tools::ToolContext context;
  context.workspace_path = config::resolve_workspace(config_);
  context.session_id = session_id_;
  context.execution_mode = config_.agent.execution_mode;
  context.permissions = deps_.permissions.get();
  context.sandbox = deps_.sandbox;
  context.sandbox_defaults = sandbox::config_from_settings(config_.sandbox);
  context.scope = permissions::ScopeEnforcer(config_.agent.scope, context.workspace_path);

  LoopOptions options;
  options.model = config_.agent.model;
  options.temperature = config_.agent.temperature;
  options.system_prompt = config_.agent.system_prompt;
  options.max_steps = config_.agent.max_turns;
  options.max_result_chars = config_.history.max_result_chars;
  return AgentLoop(deps_.provider, *deps_.tools, std::move(context), deps_.sink,
                   std::move(options));
}

RunResult Coordinator::finish(events::ExecutionJob job, const events::JobStatus status,
                              std::string message) {
  job = job.with_status(status);
  if (deps_.store) {
    if (auto saved = deps_.store->save_job(job, message); !saved.ok()) {
      observability::log_warn("failed to persist job " + job.id + ": " + saved.error());
    }
  }
  emit(events::JobCompleted{.job = job, .message = message});
  return RunResult{.job = std::move(job), .message = std::move(message)};
}

RunResult Coordinator::run(const std::string &message, const RunMode mode) {
  auto job = events::ExecutionJob::create(session_id_, message);
  observability::log_info("job " + job.id + " started in " + std::string(to_string(mode)) +
                          " mode");
  if (deps_.store) {
    if (auto saved = deps_.store->save_job(job, ""); !saved.ok()) {
      observability::log_warn("failed to persist job " + job.id + ": " + saved.error());
    }
  }
  emit(events::JobStarted{.job = job});
  persist_message("user", message);

  if (mode == RunMode::Fast) {
    emit(events::Thinking{.message = "Fast Mode: Executing directly..."});
    return run_fast(std::move(job), message);
  }

  emit(events::Thinking{.message = "Analyzing query..."});
  const std::string fast_model = config_.router.fast_model.empty()
                                     ? providers::fast_model(config_.agent.provider)
                                     : config_.router.fast_model;
  const Router router(deps_.provider, fast_model, config_.router.use_llm_fallback);
  const auto query_type = router.classify(message);
  observability::log_info("query classified as " + std::string(to_string(query_type)));

  if (query_type == QueryType::Simple) {
    emit(events::Thinking{.message = "Responding..."});
    return run_simple(std::move(job), message);
  }
  return run_planned(std::move(job), message);
}

RunResult Coordinator::run_fast(events::ExecutionJob job, const std::string &message) {
  auto loop = make_loop();
  const auto outcome = loop.run(message, job, history_);
  persist_message("assistant", outcome.text);
  return finish(std::move(job),
                outcome.success() ? events::JobStatus::Completed : events::JobStatus::Failed,
                outcome.text);
}

RunResult Coordinator::run_simple(events::ExecutionJob job, const std::string &message) {
  providers::ChatRequest request;
  request.preamble = config_.agent.system_prompt;
  request.model = config_.agent.model;
  request.temperature = config_.agent.temperature;
  history_.append_user(message);
  request.history = history_.messages();

  auto reply = deps_.provider->stream(request, [this](const std::string_view chunk) {
    emit(events::Token{.content = std::string(chunk)});
  });
  if (!reply.ok()) {
    const std::string text = "Error: " + reply.error();
    emit(events::Token{.content = text});
    return finish(std::move(job), events::JobStatus::Failed, text);
  }
  history_.append_assistant(reply.value());
  persist_message("assistant", reply.value());
  return finish(std::move(job), events::JobStatus::Completed, reply.value());
}

RunResult Coordinator::run_planned(events::ExecutionJob job, const std::string &message) {
  emit(events::Thinking{.message = "Analyzing request and creating a plan..."});

  PlannerOptions options;
  options.model = config_.agent.model;
  options.max_attempts = config_.planner.max_attempts;
  options.base_backoff_ms = config_.planner.base_backoff_ms;
  options.excerpt_chars = config_.planner.excerpt_chars;
  const Planner planner(deps_.provider, options, deps_.sleep);

  auto planned = planner.plan(message, history_.render(), [this](const std::string &token) {
    emit(events::Thinking{.message = token});
  });
  if (!planned.ok()) {
    const std::string text = "Planning failed: " + planned.error();
    observability::log_error(text);
    emit(events::Token{.content = text});
    return finish(std::move(job), events::JobStatus::Failed, text);
  }

  auto plan = std::move(planned.value());
  emit(events::PlanUpdate{.plan = plan});
  history_.append_user(message);

  auto loop = make_loop();
  for (std::size_t index = 0; index < plan.tasks.size(); ++index) {
    plan.start_task(index);
    emit(events::PlanUpdate{.plan = plan});
    const std::string &description = plan.tasks[index].description;
    emit(events::Thinking{.message = "Starting Task: " + description});

    const auto outcome = loop.run(description, job, history_);
    persist_message("assistant", outcome.text);
    if (!outcome.success()) {
      // Completed tasks keep their status; the failing one stays running.
      emit(events::PlanUpdate{.plan = plan});
      return finish(std::move(job), events::JobStatus::Failed,
                    "Task '" + description + "' failed: " + outcome.text);
    }
    plan.complete_task(index, outcome.text);
    emit(events::PlanUpdate{.plan = plan});
  }
  return finish(std::move(job), events::JobStatus::Completed, "All tasks executed.");
}

} // namespace cowork::agent
