#pragma once

#include "cowork/agent/history.hpp"
#include "cowork/events/channel.hpp"
#include "cowork/events/types.hpp"
#include "cowork/providers/traits.hpp"
#include "cowork/tools/tool_registry.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cowork::agent {

struct LoopOptions {
  std::string model;
  double temperature = 0.7;
  std::string system_prompt;
  std::uint32_t max_steps = 10;
  std::size_t max_result_chars = 8000;
};

enum class LoopStop { Answered, BudgetExhausted, ProviderError, FatalToolError };

[[nodiscard]] std::string_view to_string(LoopStop stop);

struct LoopOutcome {
  LoopStop stop = LoopStop::Answered;
  /// Final answer, or the message explaining why the run stopped.
  std::string text;
  std::size_t steps = 0;

  [[nodiscard]] bool success() const { return stop == LoopStop::Answered; }
};

/// Drives one task: ask the model, run the tool it names, feed the result back, repeat
/// until a plain-text answer, the step budget, or a fatal error.
class AgentLoop {
public:
  AgentLoop(std::shared_ptr<providers::Provider> provider, const tools::ToolRegistry &tools,
            tools::ToolContext context, std::shared_ptr<events::IEventSink> sink,
            LoopOptions options);

  /// Steps are appended to `job`; every turn lands in `history`.
  [[nodiscard]] LoopOutcome run(const std::string &task, events::ExecutionJob &job,
                                ConversationHistory &history);

  [[nodiscard]] std::string build_preamble() const;

private:
  struct StepOutcome {
    std::string feedback;
    bool fatal = false;
  };

  [[nodiscard]] StepOutcome execute_step(const std::string &tool_name,
                                         const tools::ToolArgs &args,
                                         const std::string &raw_args, events::ExecutionJob &job);
  void emit(const events::AgentEvent &event) const;

  std::shared_ptr<providers::Provider> provider_;
  const tools::ToolRegistry &tools_;
  tools::ToolContext context_;
  std::shared_ptr<events::IEventSink> sink_;
  LoopOptions options_;
  std::string channel_;
};

} // namespace cowork::agent
