#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cowork::observability {

struct AgentStartEvent {
  std::string provider;
  std::string model;
};

struct AgentEndEvent {
  std::chrono::milliseconds duration{0};
  bool success = true;
};

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct PermissionDecisionEvent {
  std::string permission_type;
  std::string resource;
  bool allowed = false;
};

struct SandboxRunEvent {
  std::string backend;
  int exit_code = 0;
  bool timed_out = false;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<AgentStartEvent, AgentEndEvent, ToolCallEvent,
                                   PermissionDecisionEvent, SandboxRunEvent, ErrorEvent>;

struct LlmLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct PendingPermissionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<LlmLatencyMetric, PendingPermissionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace cowork::observability
