#include "cowork/permissions/broker.hpp"

#include "cowork/observability/global.hpp"
#include "cowork/observability/log.hpp"

namespace cowork::permissions {

namespace {

std::future<PermissionResponse> ready(PermissionResponse response) {
  std::promise<PermissionResponse> promise;
  promise.set_value(response);
  return promise.get_future();
}

} // namespace

bool IPermissionBroker::request(PermissionRequest request) {
  return is_allowed(submit(std::move(request)).get());
}

bool IPermissionBroker::resolve(const std::string &id, bool allowed) {
  return resolve_response(id, allowed ? PermissionResponse::Allow : PermissionResponse::Deny);
}

PermissionBroker::PermissionBroker(std::shared_ptr<events::IEventSink> sink)
    : sink_(std::move(sink)) {}

PermissionBroker::~PermissionBroker() {
  std::unordered_map<std::string, Pending> leftover;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    leftover.swap(pending_);
  }
  for (auto &[id, pending] : leftover) {
    pending.promise.set_value(PermissionResponse::Deny);
  }
}

std::future<PermissionResponse> PermissionBroker::submit(PermissionRequest request) {
  if (!sink_) {
    observability::log_warn("permission request " + request.id +
                            " denied: no event sink to deliver it");
    return ready(PermissionResponse::Deny);
  }

  std::future<PermissionResponse> future;
  std::size_t pending_now = 0;
  const std::string session_id = request.session_id();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = pending_.try_emplace(request.id);
    if (!inserted) {
      return ready(PermissionResponse::Deny);
    }
    it->second.session_id = session_id;
    future = it->second.promise.get_future();
    pending_now = pending_.size();
  }
  observability::record_metric(observability::PendingPermissionsMetric{.count = pending_now});

  const std::string channel =
      session_id.empty() ? std::string("permission_request") : events::session_channel(session_id);
  observability::log_debug("permission request " + request.id + " emitted on " + channel);
  sink_->emit(channel, events::PermissionRequested{.request = std::move(request)});
  return future;
}

bool PermissionBroker::resolve_response(const std::string &id, PermissionResponse response) {
  std::promise<PermissionResponse> promise;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pending_.find(id);
    if (it == pending_.end()) {
      return false;
    }
    promise = std::move(it->second.promise);
    pending_.erase(it);
  }
  promise.set_value(response);
  return true;
}

std::vector<std::string> PermissionBroker::list_pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(pending_.size());
  for (const auto &[id, pending] : pending_) {
    ids.push_back(id);
  }
  return ids;
}

std::size_t PermissionBroker::cancel_session(const std::string &session_id) {
  std::vector<std::promise<PermissionResponse>> cancelled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second.session_id == session_id) {
        cancelled.push_back(std::move(it->second.promise));
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &promise : cancelled) {
    promise.set_value(PermissionResponse::Deny);
  }
  return cancelled.size();
}

std::size_t PermissionBroker::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

std::future<PermissionResponse> AutonomousBroker::submit(PermissionRequest request) {
  observability::log_debug("auto-approving permission request " + request.id);
  return ready(PermissionResponse::Allow);
}

} // namespace cowork::permissions
