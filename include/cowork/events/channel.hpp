#pragma once

#include "cowork/events/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace cowork::events {

/// Consumer of progress events. `channel` is `session:<id>` for session scoped events.
class IEventSink {
public:
  virtual ~IEventSink() = default;
  virtual void emit(const std::string &channel, const AgentEvent &event) = 0;
};

[[nodiscard]] std::string session_channel(const std::string &session_id);

using EventCallback = std::function<void(const std::string &channel, const AgentEvent &event)>;

/// Fan-out sink. Emitting with no subscribers is a no-op.
class EventChannel final : public IEventSink {
public:
  using SubscriptionId = std::uint64_t;

  SubscriptionId subscribe(EventCallback callback);
  void unsubscribe(SubscriptionId id);
  [[nodiscard]] std::size_t subscriber_count() const;

  void emit(const std::string &channel, const AgentEvent &event) override;

private:
  mutable std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<SubscriptionId, EventCallback> subscribers_;
};

} // namespace cowork::events
