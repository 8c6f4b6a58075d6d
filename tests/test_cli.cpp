#include "test_framework.hpp"

#include "cowork/cli/commands.hpp"

#include <string>
#include <vector>

namespace {

namespace ev = cowork::events;
using cowork::permissions::PermissionResponse;

int run_with(std::vector<std::string> args) {
  args.insert(args.begin(), "cowork");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return cowork::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

void register_cli_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;

  tests.push_back({"cli_approval_answers", [] {
                     using cowork::cli::parse_approval_answer;
                     require(parse_approval_answer("y") == PermissionResponse::Allow, "y");
                     require(parse_approval_answer(" YES\n") == PermissionResponse::Allow, "yes");
                     require(parse_approval_answer("a") == PermissionResponse::AllowAlways, "a");
                     require(parse_approval_answer("always") == PermissionResponse::AllowAlways,
                             "always");
                     require(parse_approval_answer("") == PermissionResponse::Deny, "empty denies");
                     require(parse_approval_answer("sure") == PermissionResponse::Deny,
                             "anything else denies");
                   }});

  tests.push_back({"cli_format_event_lines", [] {
                     using cowork::cli::format_event;
                     require(format_event(ev::Token{.content = "abc"}) == std::string("abc"), "token");
                     require(format_event(ev::Thinking{.message = "Analyzing query..."}) ==
                                 std::string("... Analyzing query..."),
                             "thinking");
                     auto step = ev::ToolStep::create("bash", R"({"command":"ls"})");
                     auto job = ev::ExecutionJob::create("s", "q");
                     require(format_event(ev::StepStarted{.job = job, .step = step}) ==
                                 std::string(R"(-> bash {"command":"ls"})"),
                             "step started");
                     step.status = ev::StepStatus::Failed;
                     require(format_event(ev::StepCompleted{.job = job, .step = step}) ==
                                 std::string("<- bash [failed]"),
                             "step completed");
                     require(format_event(ev::Error{.message = "boom", .error = std::nullopt}) ==
                                 std::string("error: boom"),
                             "error");
                     require(format_event(ev::JobCompleted{.job = job.with_status(ev::JobStatus::Completed),
                                                           .message = "done"}) ==
                                 std::string("job completed: done"),
                             "job completed");
                     require(!format_event(ev::JobStarted{.job = job}).has_value(), "job start is quiet");
                   }});

  tests.push_back({"cli_format_plan_update", [] {
                     ev::Plan plan;
                     plan.tasks.push_back({.id = "1", .description = "write notes"});
                     plan.tasks.push_back({.id = "2", .description = "report"});
                     (void)plan.start_task(0);
                     const auto line = cowork::cli::format_event(ev::PlanUpdate{.plan = plan});
                     require(line == std::string("plan:\n  [running] write notes\n  [pending] report"),
                             line.value_or("<none>"));
                   }});

  tests.push_back({"cli_dispatch_exit_codes", [] {
                     require(run_with({"version"}) == 0, "version");
                     require(run_with({"help"}) == 0, "help");
                     require(run_with({"frobnicate"}) == 1, "unknown command");
                     require(run_with({"classify", "--offline", "create", "a", "file"}) == 0,
                             "offline classification");
                     require(run_with({"classify", "--offline"}) == 1, "missing query");
                     require(run_with({"run", "--mode", "turbo", "hi"}) == 1, "bad run mode");
                   }});
}
