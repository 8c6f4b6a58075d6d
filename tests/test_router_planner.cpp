#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cowork/agent/planner.hpp"
#include "cowork/agent/router.hpp"

#include <memory>

namespace {

namespace ag = cowork::agent;
using cowork::testing::ScriptedProvider;

ag::PlannerOptions planner_options() {
  ag::PlannerOptions options;
  options.model = "gpt-4o";
  return options;
}

} // namespace

void register_router_planner_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;

  tests.push_back({"router_markers_complex_before_simple", [] {
                     require(ag::classify_by_markers("Hello there") == ag::QueryType::Simple,
                             "greeting is simple");
                     require(ag::classify_by_markers("What is a monad?") == ag::QueryType::Simple,
                             "question is simple");
                     require(ag::classify_by_markers("Create a file called notes.md") ==
                                 ag::QueryType::Complex,
                             "file work is complex");
                     require(ag::classify_by_markers("hello, please fix the build") ==
                                 ag::QueryType::Complex,
                             "complex markers win");
                     require(!ag::classify_by_markers("quantum mechanics").has_value(),
                             "no marker");
                   }});

  tests.push_back({"router_markers_skip_the_model", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     ag::Router router(provider, "gpt-4o-mini");
                     require(router.classify("thanks!") == ag::QueryType::Simple, "simple");
                     require(router.classify("deploy the service") == ag::QueryType::Complex,
                             "complex");
                     require(provider->requests().empty(), "model never asked");
                   }});

  tests.push_back({"router_llm_fallback", [] {
                     auto provider = std::make_shared<ScriptedProvider>(
                         std::vector<std::string>{" simple. ", "COMPLEX"});
                     ag::Router router(provider, "gpt-4o-mini");
                     require(router.classify("quantum mechanics") == ag::QueryType::Simple,
                             "model says simple");
                     require(router.classify("quantum mechanics") == ag::QueryType::Complex,
                             "model says complex");
                     const auto &request = provider->requests().at(0);
                     require(request.model == "gpt-4o-mini", "fast model used");
                     require(request.temperature == 0.0, "deterministic");
                     require(request.preamble.find("SIMPLE") != std::string::npos, "classifier prompt");
                   }});

  tests.push_back({"router_failure_reads_as_complex", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->push_error("network down");
                     ag::Router router(provider, "m");
                     require(router.classify("quantum mechanics") == ag::QueryType::Complex,
                             "error is complex");
                     ag::Router offline(provider, "m", false);
                     require(offline.classify("quantum mechanics") == ag::QueryType::Complex,
                             "no fallback is complex");
                     require(provider->requests().size() == 1, "offline router skips the model");
                   }});

  tests.push_back({"planner_backoff_schedule", [] {
                     require(ag::backoff_delay_ms(1, 1000) == 1000, "first retry");
                     require(ag::backoff_delay_ms(2, 1000) == 2000, "second retry");
                     require(ag::backoff_delay_ms(3, 1000) == 4000, "third retry");
                     require(ag::backoff_delay_ms(0, 1000) == 0, "no attempt yet");
                   }});

  tests.push_back({"planner_parse_plan", [] {
                     auto plan = ag::parse_plan(
                         R"({"objective":"ship it","tasks":[{"id":7,"description":"build"},{"description":"test"}]})");
                     require(plan.ok(), plan.ok() ? "" : plan.error());
                     require(plan.value().objective == "ship it", "objective");
                     require(plan.value().tasks.size() == 2, "two tasks");
                     require(plan.value().tasks[0].id == "7", "explicit id kept");
                     require(plan.value().tasks[1].id == "2", "positional id");
                     require(plan.value().tasks[1].status == cowork::events::TaskStatus::Pending,
                             "tasks start pending");
                     require(!plan.value().id.empty(), "plan id assigned");
                   }});

  tests.push_back({"planner_parse_plan_errors", [] {
                     require(!ag::parse_plan("[]").ok(), "not an object");
                     auto no_tasks = ag::parse_plan(R"({"objective":"x"})");
                     require(!no_tasks.ok() && no_tasks.error() == "missing field `tasks`",
                             "missing tasks");
                     auto scalar = ag::parse_plan(R"({"tasks":"build"})");
                     require(!scalar.ok() && scalar.error() == "field `tasks` must be an array",
                             "tasks not array");
                     auto blank = ag::parse_plan(R"({"tasks":[{"description":"a"},{"id":2}]})");
                     require(!blank.ok() && blank.error() == "task 2 is missing field `description`",
                             "missing description");
                   }});

  tests.push_back({"planner_schema_in_prompt", [] {
                     const auto prompt = ag::render_planning_prompt("user: hi\n");
                     require(prompt.find(ag::plan_schema()) != std::string::npos, "schema embedded");
                     require(prompt.find("Conversation so far:\nuser: hi") != std::string::npos,
                             "context embedded");
                     require(ag::render_planning_prompt("  ").find("Conversation so far") ==
                                 std::string::npos,
                             "blank context omitted");
                   }});

  tests.push_back({"planner_extracts_fenced_plan", [] {
                     auto provider = std::make_shared<ScriptedProvider>(std::vector<std::string>{
                         "Sure!\n```json\n{\"tasks\":[{\"description\":\"list files\"}]}\n```"});
                     std::vector<std::chrono::milliseconds> sleeps;
                     ag::Planner planner(provider, planner_options(),
                                         [&](std::chrono::milliseconds d) { sleeps.push_back(d); });
                     std::string tokens;
                     auto plan = planner.plan("tidy the repo", "", [&](const std::string &t) {
                       tokens += t;
                     });
                     require(plan.ok(), plan.ok() ? "" : plan.error());
                     require(plan.value().objective == "tidy the repo", "objective defaults");
                     require(plan.value().tasks.at(0).description == "list files", "task");
                     require(sleeps.empty(), "no retries");
                     require(tokens.find("list files") != std::string::npos, "tokens streamed");
                     require(provider->requests().at(0).model == "gpt-4o", "planner model");
                   }});

  tests.push_back({"planner_retries_with_backoff_then_succeeds", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->push_error("timeout");
                     provider->push_reply("");
                     provider->push_reply(R"({"tasks":[{"description":"do it"}]})");
                     std::vector<std::chrono::milliseconds> sleeps;
                     ag::Planner planner(provider, planner_options(),
                                         [&](std::chrono::milliseconds d) { sleeps.push_back(d); });
                     std::string tokens;
                     auto plan = planner.plan("x", "", [&](const std::string &t) { tokens += t; });
                     require(plan.ok(), plan.ok() ? "" : plan.error());
                     require(sleeps.size() == 2, "two waits");
                     require(sleeps[0].count() == 1000 && sleeps[1].count() == 2000, "doubling");
                     require(tokens.find("Attempt 1 failed. Retrying in 1s...") != std::string::npos,
                             tokens);
                     require(tokens.find("Attempt 2 failed. Retrying in 2s...") != std::string::npos,
                             tokens);
                   }});

  tests.push_back({"planner_gives_up_with_excerpt", [] {
                     const std::string long_reply(300, 'x');
                     auto provider = std::make_shared<ScriptedProvider>(
                         std::vector<std::string>{"nope", "still nope", long_reply});
                     ag::Planner planner(provider, planner_options(), [](std::chrono::milliseconds) {});
                     auto plan = planner.plan("x", "", nullptr);
                     require(!plan.ok(), "three malformed replies fail");
                     require(provider->requests().size() == 3, "three attempts");
                     require(plan.error().find("Failed to parse generated plan: ") == 0, plan.error());
                     require(plan.error().find("Response start: '" + std::string(200, 'x') + "...'") !=
                                 std::string::npos,
                             "first 200 chars of the last reply");
                   }});

  tests.push_back({"planner_provider_errors_exhaust_attempts", [] {
                     auto provider = std::make_shared<ScriptedProvider>();
                     provider->push_error("e1");
                     provider->push_error("e2");
                     provider->push_error("e3");
                     ag::Planner planner(provider, planner_options(), [](std::chrono::milliseconds) {});
                     auto plan = planner.plan("x", "", nullptr);
                     require(!plan.ok() && plan.error() == "Planning failed after 3 attempts: e3",
                             plan.ok() ? "unexpected plan" : plan.error());
                   }});
}
