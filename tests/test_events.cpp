#include "test_framework.hpp"

#include "cowork/events/channel.hpp"
#include "cowork/events/types.hpp"

#include <atomic>

void register_events_tests(std::vector<cowork::tests::TestCase> &tests) {
  using cowork::tests::require;
  namespace ev = cowork::events;

  tests.push_back({"events_job_steps_append_only", [] {
                     auto job = ev::ExecutionJob::create("s1", "list files");
                     require(!job.id.empty() && job.status == ev::JobStatus::Running,
                             "fresh job is running");
                     const auto first = job.append_step(ev::ToolStep::create("bash", "{}"));
                     const auto second =
                         job.append_step(ev::ToolStep::create("filesystem", "{\"a\":1}"));
                     require(first == 0 && second == 1, "step indices");
                     require(job.current_step_index == 1, "current index follows last step");
                     require(job.steps[0].status == ev::StepStatus::Pending, "steps start pending");
                     const auto done = job.with_status(ev::JobStatus::Completed);
                     require(done.status == ev::JobStatus::Completed, "copy updated");
                     require(job.status == ev::JobStatus::Running, "source job untouched");
                   }});

  tests.push_back({"events_plan_task_status_moves_forward", [] {
                     ev::Plan plan;
                     plan.tasks.push_back({.id = "1", .description = "a"});
                     plan.tasks.push_back({.id = "2", .description = "b"});
                     require(!plan.complete_task(0), "cannot complete a pending task");
                     require(plan.start_task(0), "start pending task");
                     require(!plan.start_task(0), "cannot restart a running task");
                     require(plan.complete_task(0, std::string("done")), "complete running task");
                     require(!plan.start_task(0), "completed task stays completed");
                     require(plan.tasks[0].result == std::string("done"), "result recorded");
                     require(!plan.start_task(5), "out of range index");
                   }});

  tests.push_back({"events_to_json_carries_type", [] {
                     const auto json = ev::to_json(ev::Token{.content = "hi \"there\""});
                     require(json == R"({"type":"token","content":"hi \"there\""})",
                             "token json: " + json);
                     const auto error = ev::to_json(ev::Error{.message = "boom"});
                     require(error.find("\"error\":null") != std::string::npos,
                             "absent error is null");
                     auto job = ev::ExecutionJob::create("s", "q");
                     const auto done =
                         ev::to_json(ev::JobCompleted{.job = job, .message = "ok"});
                     require(done.find("\"type\":\"job_completed\"") != std::string::npos,
                             "job_completed tag");
                     require(done.find("\"status\":\"running\"") != std::string::npos,
                             "job status serialized");
                   }});

  tests.push_back({"events_step_status_names", [] {
                     require(ev::to_string(ev::StepStatus::WaitingApproval) == "waiting_approval",
                             "waiting approval name");
                     require(ev::step_status_from_string("skipped") == ev::StepStatus::Skipped,
                             "parse skipped");
                     require(ev::job_status_from_string("failed") == ev::JobStatus::Failed,
                             "parse failed");
                   }});

  tests.push_back({"events_channel_fanout_and_unsubscribe", [] {
                     ev::EventChannel channel;
                     channel.emit("session:x", ev::Thinking{.message = "nobody listening"});
                     std::atomic<int> a{0};
                     std::atomic<int> b{0};
                     std::string seen_channel;
                     const auto first = channel.subscribe(
                         [&](const std::string &name, const ev::AgentEvent &) {
                           seen_channel = name;
                           ++a;
                         });
                     (void)channel.subscribe([&](const std::string &, const ev::AgentEvent &) { ++b; });
                     channel.emit(ev::session_channel("x"), ev::Thinking{.message = "hello"});
                     require(a == 1 && b == 1, "both subscribers notified");
                     require(seen_channel == "session:x", "channel name");
                     channel.unsubscribe(first);
                     channel.emit("session:x", ev::Thinking{.message = "again"});
                     require(a == 1 && b == 2, "unsubscribed callback not called");
                     require(channel.subscriber_count() == 1, "one subscriber left");
                   }});
}
