#include "cowork/observability/global.hpp"

#include <mutex>

namespace cowork::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->record_metric(metric);
  }
}

void record_agent_start(const std::string &provider, const std::string &model) {
  record_event(AgentStartEvent{.provider = provider, .model = model});
}

void record_agent_end(std::chrono::milliseconds duration, bool success) {
  record_event(AgentEndEvent{.duration = duration, .success = success});
}

void record_tool_call(const std::string &tool, std::chrono::milliseconds duration,
                      const bool success) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .success = success});
}

void record_permission_decision(const std::string &permission_type, const std::string &resource,
                                const bool allowed) {
  record_event(PermissionDecisionEvent{
      .permission_type = permission_type, .resource = resource, .allowed = allowed});
}

void record_sandbox_run(const std::string &backend, const int exit_code, const bool timed_out,
                        std::chrono::milliseconds duration) {
  record_event(SandboxRunEvent{
      .backend = backend, .exit_code = exit_code, .timed_out = timed_out, .duration = duration});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace cowork::observability
