#include "cowork/observability/log_observer.hpp"

#include "cowork/observability/log.hpp"

#include <type_traits>

namespace cowork::observability {

namespace {

std::string bool_text(bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AgentStartEvent>) {
          log_info("agent.start provider=" + evt.provider + " model=" + evt.model);
        } else if constexpr (std::is_same_v<T, AgentEndEvent>) {
          log_info("agent.end duration_ms=" + std::to_string(evt.duration.count()) +
                   " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, ToolCallEvent>) {
          log_info("tool.call name=" + evt.tool + " duration_ms=" +
                   std::to_string(evt.duration.count()) + " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, PermissionDecisionEvent>) {
          log_info("permission.decision type=" + evt.permission_type +
                   " resource=" + evt.resource + " allowed=" + bool_text(evt.allowed));
        } else if constexpr (std::is_same_v<T, SandboxRunEvent>) {
          log_debug("sandbox.run backend=" + evt.backend + " exit_code=" +
                    std::to_string(evt.exit_code) + " timed_out=" + bool_text(evt.timed_out) +
                    " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_error(evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LlmLatencyMetric>) {
          log_debug("metric.llm_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, PendingPermissionsMetric>) {
          log_debug("metric.pending_permissions=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace cowork::observability
