#pragma once

#include "cowork/events/types.hpp"
#include "cowork/providers/reliable.hpp"
#include "cowork/providers/traits.hpp"

#include <functional>
#include <memory>
#include <string>

namespace cowork::agent {

struct PlannerOptions {
  std::string model;
  double temperature = 0.2;
  std::uint32_t max_attempts = 3;
  std::uint64_t base_backoff_ms = 1000;
  std::size_t excerpt_chars = 200;
};

using TokenSink = std::function<void(const std::string &)>;

/// Wait before the attempt after `attempt` (1-based): base * 2^(attempt-1).
[[nodiscard]] std::uint64_t backoff_delay_ms(std::uint32_t attempt, std::uint64_t base_ms);

/// JSON schema the planning prompt asks the model to follow.
[[nodiscard]] const std::string &plan_schema();
[[nodiscard]] std::string render_planning_prompt(const std::string &context);

/// Parses `{"objective"?: str, "tasks": [{"description": str, "id"?: ...}]}`.
[[nodiscard]] common::Result<events::Plan> parse_plan(const std::string &json);

/// Turns a complex objective into an ordered Plan through a schema-constrained completion.
class Planner {
public:
  Planner(std::shared_ptr<providers::Provider> provider, PlannerOptions options,
          providers::SleepFn sleep = {});

  /// Streams every attempt's tokens and retry notices to `on_token`.
  [[nodiscard]] common::Result<events::Plan> plan(const std::string &objective,
                                                  const std::string &context,
                                                  const TokenSink &on_token) const;

private:
  std::shared_ptr<providers::Provider> provider_;
  PlannerOptions options_;
  providers::SleepFn sleep_;
};

} // namespace cowork::agent
