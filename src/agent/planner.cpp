#include "cowork/agent/planner.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/common/ids.hpp"
#include "cowork/common/json_util.hpp"
#include "cowork/observability/log.hpp"

#include <cstdio>
#include <thread>

namespace cowork::agent {

namespace {

std::string format_seconds(const std::uint64_t ms) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%g", static_cast<double>(ms) / 1000.0);
  return buffer;
}

std::string excerpt(const std::string &text, const std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  return text.substr(0, limit) + "...";
}

} // namespace

std::uint64_t backoff_delay_ms(const std::uint32_t attempt, const std::uint64_t base_ms) {
  if (attempt == 0) {
    return 0;
  }
  return base_ms * (1ULL << (attempt - 1));
}

const std::string &plan_schema() {
  static const std::string schema =
      R"({"type":"object","required":["tasks"],"properties":{)"
      R"("objective":{"type":"string","description":"One sentence restating the goal"},)"
      R"("tasks":{"type":"array","items":{"type":"object","required":["description"],)"
      R"("properties":{"id":{"type":"integer"},"description":{"type":"string"}}}}}})";
  return schema;
}

std::string render_planning_prompt(const std::string &context) {
  std::string prompt =
      "You are a planning agent. Break the user's request into a short, ordered list of "
      "concrete tasks that an assistant with file, shell and search tools can execute one "
      "after another. Each task must be self-contained and actionable.\n\n"
      "Respond with a single JSON object that matches this schema and nothing else:\n";
  prompt += plan_schema();
  prompt += "\n";
  if (!common::trim(context).empty()) {
    prompt += "\nConversation so far:\n" + context + "\n";
  }
  return prompt;
}

common::Result<events::Plan> parse_plan(const std::string &json) {
  if (!common::json_is_object(json)) {
    return common::Result<events::Plan>::failure("expected a JSON object");
  }
  const auto top = common::json_parse_flat(json);
  const auto tasks_json = top.find("tasks");
  if (tasks_json == top.end()) {
    return common::Result<events::Plan>::failure("missing field `tasks`");
  }
  if (!common::starts_with(common::trim(tasks_json->second), "[")) {
    return common::Result<events::Plan>::failure("field `tasks` must be an array");
  }

  events::Plan plan;
  plan.id = common::new_uuid();
  if (const auto objective = top.find("objective"); objective != top.end()) {
    plan.objective = objective->second;
  }
  std::size_t index = 0;
  for (const auto &task_json : common::json_split_top_level_objects(tasks_json->second)) {
    ++index;
    const auto fields = common::json_parse_flat(task_json);
    const auto description = fields.find("description");
    if (description == fields.end() || common::trim(description->second).empty()) {
      return common::Result<events::Plan>::failure("task " + std::to_string(index) +
                                                   " is missing field `description`");
    }
    events::Task task;
    const auto id = fields.find("id");
    task.id = id != fields.end() && !id->second.empty() ? id->second : std::to_string(index);
    task.description = description->second;
    plan.tasks.push_back(std::move(task));
  }
  return common::Result<events::Plan>::success(std::move(plan));
}

Planner::Planner(std::shared_ptr<providers::Provider> provider, PlannerOptions options,
                 providers::SleepFn sleep)
    : provider_(std::move(provider)), options_(std::move(options)), sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

common::Result<events::Plan> Planner::plan(const std::string &objective,
                                           const std::string &context,
                                           const TokenSink &on_token) const {
  providers::ChatRequest request;
  request.preamble = render_planning_prompt(context);
  request.history.push_back(providers::ChatMessage::user(objective));
  request.model = options_.model;
  request.temperature = options_.temperature;

  const auto forward = [&on_token](const std::string_view chunk) {
    if (on_token) {
      on_token(std::string(chunk));
    }
  };
  const std::string attempts_text = std::to_string(options_.max_attempts);

  for (std::uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    const bool last = attempt == options_.max_attempts;
    auto response = provider_->stream(request, forward);

    if (!response.ok()) {
      observability::log_error("planning attempt " + std::to_string(attempt) +
                               " failed: " + response.error());
      if (last) {
        return common::Result<events::Plan>::failure("Planning failed after " + attempts_text +
                                                     " attempts: " + response.error());
      }
    } else if (response.value().empty()) {
      observability::log_error("planning attempt " + std::to_string(attempt) +
                               " failed: Empty response");
      if (last) {
        return common::Result<events::Plan>::failure("Planning failed after " + attempts_text +
                                                     " attempts: Empty response");
      }
    } else {
      auto parsed = parse_plan(common::extract_json_frame(response.value()));
      if (parsed.ok()) {
        if (parsed.value().objective.empty()) {
          parsed.value().objective = objective;
        }
        return parsed;
      }
      observability::log_error("failed to parse plan JSON: " + parsed.error() + ". Attempt " +
                               std::to_string(attempt) + "/" + attempts_text);
      if (last) {
        return common::Result<events::Plan>::failure(
            "Failed to parse generated plan: " + parsed.error() + ". Response start: '" +
            excerpt(response.value(), options_.excerpt_chars) + "'");
      }
    }

    const std::uint64_t wait_ms = backoff_delay_ms(attempt, options_.base_backoff_ms);
    if (on_token) {
      on_token("\n⚠️ Attempt " + std::to_string(attempt) + " failed. Retrying in " +
               format_seconds(wait_ms) + "s...\n");
    }
    sleep_(std::chrono::milliseconds(wait_ms));
  }
  return common::Result<events::Plan>::failure("Planning failed after " + attempts_text +
                                               " attempts");
}

} // namespace cowork::agent
