#include "cowork/events/channel.hpp"

#include <vector>

namespace cowork::events {

std::string session_channel(const std::string &session_id) { return "session:" + session_id; }

EventChannel::SubscriptionId EventChannel::subscribe(EventCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace(id, std::move(callback));
  return id;
}

void EventChannel::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(id);
}

std::size_t EventChannel::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

void EventChannel::emit(const std::string &channel, const AgentEvent &event) {
  std::vector<EventCallback> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(subscribers_.size());
    for (const auto &[id, callback] : subscribers_) {
      targets.push_back(callback);
    }
  }
  // Callbacks run unlocked so a subscriber may resolve permissions or unsubscribe.
  for (const auto &callback : targets) {
    callback(channel, event);
  }
}

} // namespace cowork::events
