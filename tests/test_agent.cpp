#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cowork/agent/agent_loop.hpp"
#include "cowork/agent/history.hpp"
#include "cowork/agent/tool_call.hpp"
#include "cowork/permissions/handler.hpp"
#include "cowork/permissions/manager.hpp"
#include "cowork/tools/tool_registry.hpp"

#include <memory>

namespace {

namespace ag = cowork::agent;
namespace ev = cowork::events;
using cowork::testing::ScriptedProvider;

constexpr const char *kBashCall = R"({"tool":"bash","args":{"command":"ls"}})";

struct LoopHarness {
  cowork::testing::TempWorkspace ws;
  std::shared_ptr<ScriptedProvider> provider = std::make_shared<ScriptedProvider>();
  std::shared_ptr<cowork::testing::RecordingSink> sink =
      std::make_shared<cowork::testing::RecordingSink>();
  std::shared_ptr<cowork::testing::FakeSandbox> sandbox =
      std::make_shared<cowork::testing::FakeSandbox>();
  std::shared_ptr<cowork::permissions::PermissionManager> manager;
  cowork::tools::ToolRegistry registry = cowork::tools::ToolRegistry::create_default();
  ag::LoopOptions options;
  ev::ExecutionJob job = ev::ExecutionJob::create("loop", "task");
  ag::ConversationHistory history;

  explicit LoopHarness(std::shared_ptr<cowork::permissions::IPermissionHandler> handler =
                           std::make_shared<cowork::permissions::AllowAllHandler>())
      : manager(std::make_shared<cowork::permissions::PermissionManager>(std::move(handler))) {
    options.model = "gpt-4o";
    options.max_steps = 5;
  }

  ag::LoopOutcome run(const std::string &task) {
    cowork::tools::ToolContext ctx;
    ctx.workspace_path = ws.path();
    ctx.session_id = "loop";
    ctx.permissions = manager.get();
    ctx.sandbox = sandbox;
    ag::AgentLoop loop(provider, registry, ctx, sink, options);
    return loop.run(task, job, history);
  }
};

} // namespace

void register_agent_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;

  tests.push_back({"agent_truncate_result_keeps_both_ends", [] {
                     require(ag::truncate_result("short", 10) == "short", "within limit");
                     const std::string text = std::string(50, 'a') + std::string(50, 'b');
                     const auto cut = ag::truncate_result(text, 20);
                     require(cut.find(std::string(10, 'a') + "\n... [truncated 80 chars] ...\n" +
                                      std::string(10, 'b')) == 0,
                             cut);
                     const std::string utf8 = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";
                     const auto safe = ag::truncate_result(utf8, 3);
                     require(safe.find("\xC3\xA9") != std::string::npos, "no split code points");
                     require(safe.front() != '\xA9', "head does not start mid sequence");
                   }});

  tests.push_back({"agent_truncate_result_tiny_limits_keep_prefix_and_suffix", [] {
                     for (const std::size_t limit : {std::size_t{0}, std::size_t{1}, std::size_t{2}}) {
                       const auto cut = ag::truncate_result("abcdefghij", limit);
                       require(cut == "a\n... [truncated 8 chars] ...\nj",
                               "limit " + std::to_string(limit) + ": " + cut);
                     }
                     require(ag::truncate_result("ab", 1) == "ab", "nothing left to cut");
                     const std::string wide = "\xC3\xA9xyz\xC3\xA9";
                     const auto cut = ag::truncate_result(wide, 1);
                     require(cut.rfind("\xC3\xA9\n", 0) == 0, "whole first code point kept: " + cut);
                     require(cut.size() >= 2 && cut.substr(cut.size() - 2) == "\xC3\xA9",
                             "whole last code point kept");
                   }});

  tests.push_back({"agent_history_evicts_oldest", [] {
                     ag::ConversationHistory history(10);
                     history.append_user("12345");
                     history.append_assistant("67890");
                     require(history.size() == 2 && history.total_chars() == 10, "at budget");
                     history.append_tool("abc");
                     require(history.size() == 2, "oldest dropped");
                     require(history.messages().front().content == "67890", "order kept");
                     require(history.evicted() == 1, "eviction counted");
                     history.append_user(std::string(50, 'x'));
                     require(history.size() == 1, "newest always survives");
                     require(history.render() == "user: " + std::string(50, 'x') + "\n", "render");
                     history.clear();
                     require(history.empty() && history.total_chars() == 0, "cleared");
                   }});

  tests.push_back({"agent_parse_tool_call", [] {
                     auto call = ag::parse_tool_call(
                         "I'll look.\n```json\n{\"tool\": \"filesystem\", \"args\": {\"operation\": "
                         "\"list_dir\", \"path\": \".\"}}\n```");
                     require(call.has_value(), "call found");
                     require(call->name == "filesystem", "name");
                     require(call->arguments.at("operation") == "list_dir", "argument");
                     require(call->raw_arguments.find("list_dir") != std::string::npos, "raw args");

                     auto bare = ag::parse_tool_call(R"({"tool":"bash"})");
                     require(bare.has_value() && bare->arguments.empty() && bare->raw_arguments == "{}",
                             "args optional");
                     auto skip = ag::parse_tool_call(R"({"note":1} then {"tool":"search","args":{"query":"x"}})");
                     require(skip.has_value() && skip->name == "search", "first object with tool");
                     require(!ag::parse_tool_call("The answer is 42.").has_value(), "plain text");
                     require(!ag::parse_tool_call(R"({"tool":{"name":"x"}})").has_value(),
                             "tool must be a string");
                   }});

  tests.push_back({"agent_loop_plain_answer", [] {
                     LoopHarness h;
                     h.provider->push_reply("Nothing to do.");
                     const auto outcome = h.run("say something");
                     require(outcome.stop == ag::LoopStop::Answered && outcome.success(), "answered");
                     require(outcome.text == "Nothing to do." && outcome.steps == 0, "text");
                     require(h.history.size() == 2, "user and assistant turns");
                     require(h.sink->count("token") == 1, "answer streamed as token");
                     require(h.sink->events().at(0).first == "session:loop", "session channel");
                     const auto &request = h.provider->requests().at(0);
                     require(request.preamble.find("Workspace: ") != std::string::npos, "workspace");
                     require(request.preamble.find("- bash:") != std::string::npos, "tools listed");
                   }});

  tests.push_back({"agent_loop_runs_tool_then_answers", [] {
                     LoopHarness h;
                     h.sandbox->next = cowork::sandbox::ExecutionResult::ok("a.txt\n");
                     h.provider->push_reply(kBashCall);
                     h.provider->push_reply("There is one file.");
                     const auto outcome = h.run("what files exist?");
                     require(outcome.success() && outcome.steps == 1, "one step then answer");
                     require(h.sandbox->commands.at(0) == "ls", "command executed");
                     require(h.job.steps.size() == 1, "step recorded");
                     require(h.job.steps[0].status == ev::StepStatus::Completed, "step completed");
                     require(h.job.steps[0].tool_name == "bash", "step tool");
                     const auto &second = h.provider->requests().at(1).history;
                     require(second.back().role == "tool", "feedback turn");
                     require(second.back().content.find("Tool 'bash' returned:\n") == 0,
                             second.back().content);
                     const auto types = h.sink->types();
                     const std::vector<std::string> expected = {
                         "thinking", "step_started", "approval_required", "step_approved",
                         "step_completed", "token"};
                     require(types == expected, "event order");
                   }});

  tests.push_back({"agent_loop_recoverable_error_goes_back_to_model", [] {
                     LoopHarness h;
                     h.provider->push_reply(R"({"tool":"teleport","args":{}})");
                     h.provider->push_reply(R"({"tool":"filesystem","args":{"operation":"read_file"}})");
                     h.provider->push_reply("Giving up politely.");
                     const auto outcome = h.run("do things");
                     require(outcome.success() && outcome.steps == 2, "loop continued");
                     require(h.job.steps[0].status == ev::StepStatus::Failed, "unknown tool failed");
                     const auto &history = h.provider->requests().at(1).history;
                     require(history.back().content.find("Unknown tool: teleport") != std::string::npos,
                             "error fed back");
                     const auto &third = h.provider->requests().at(2).history;
                     require(third.back().content.find("Missing required argument: path") !=
                                 std::string::npos,
                             third.back().content);
                   }});

  tests.push_back({"agent_loop_fatal_tool_error_stops", [] {
                     LoopHarness h(std::make_shared<cowork::permissions::DenyAllHandler>());
                     h.provider->push_reply(kBashCall);
                     h.provider->push_reply("never read");
                     const auto outcome = h.run("list files");
                     require(outcome.stop == ag::LoopStop::FatalToolError, "fatal stop");
                     require(outcome.text.find("Permission denied") != std::string::npos, outcome.text);
                     require(h.provider->requests().size() == 1, "model not asked again");
                     require(h.sandbox->commands.empty(), "nothing ran");
                     require(h.job.steps[0].status == ev::StepStatus::Skipped, "rejected step skipped");
                     require(h.sink->count("step_rejected") == 1, "rejection reported");
                     require(h.sink->count("error") == 1, "error event");
                   }});

  tests.push_back({"agent_loop_step_budget", [] {
                     LoopHarness h;
                     h.options.max_steps = 2;
                     for (int i = 0; i < 4; ++i) {
                       h.provider->push_reply(kBashCall);
                     }
                     const auto outcome = h.run("loop forever");
                     require(outcome.stop == ag::LoopStop::BudgetExhausted, "budget stop");
                     require(outcome.steps == 2 && h.sandbox->commands.size() == 2, "two steps ran");
                     require(outcome.text == "Stopped after reaching the limit of 2 tool steps",
                             outcome.text);
                     require(h.provider->requests().size() == 3, "third reply was refused");
                   }});

  tests.push_back({"agent_loop_provider_error", [] {
                     LoopHarness h;
                     h.provider->push_error("503 upstream");
                     const auto outcome = h.run("anything");
                     require(outcome.stop == ag::LoopStop::ProviderError, "provider stop");
                     require(outcome.text == "503 upstream", outcome.text);
                     require(h.sink->count("error") == 1, "error event");
                     require(ag::to_string(outcome.stop) == "provider_error", "stop name");
                   }});

  tests.push_back({"agent_loop_truncates_tool_output", [] {
                     LoopHarness h;
                     h.options.max_result_chars = 40;
                     h.sandbox->next = cowork::sandbox::ExecutionResult::ok(std::string(500, 'z'));
                     h.provider->push_reply(kBashCall);
                     h.provider->push_reply("done");
                     const auto outcome = h.run("big output");
                     require(outcome.success(), outcome.text);
                     const auto &result = h.job.steps[0].result;
                     require(result.has_value() && result->find("[truncated") != std::string::npos,
                             "step result truncated");
                     require(result->size() < 100, "bounded size");
                   }});
}
