#pragma once

#include "cowork/events/channel.hpp"
#include "cowork/permissions/types.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cowork::permissions {

/// Turns a privileged action into a suspend point resolved later by an external actor.
class IPermissionBroker {
public:
  virtual ~IPermissionBroker() = default;

  /// Registers the request and returns a future fulfilled exactly once.
  [[nodiscard]] virtual std::future<PermissionResponse> submit(PermissionRequest request) = 0;

  /// Fulfils a pending request. Unknown or already resolved ids are a no-op and return false.
  virtual bool resolve_response(const std::string &id, PermissionResponse response) = 0;

  [[nodiscard]] virtual std::vector<std::string> list_pending() const = 0;

  /// Blocks the caller until the request is resolved.
  [[nodiscard]] bool request(PermissionRequest request);
  bool resolve(const std::string &id, bool allowed);
};

/// Pending requests live in a mutex-guarded map of one-shot promises keyed by request id.
/// Each request is announced as a PermissionRequested event on `session:<id>`, or on the
/// `permission_request` channel when the request names no session. Without an event sink
/// nobody could answer, so requests are denied immediately.
class PermissionBroker final : public IPermissionBroker {
public:
  explicit PermissionBroker(std::shared_ptr<events::IEventSink> sink = nullptr);
  ~PermissionBroker() override;

  PermissionBroker(const PermissionBroker &) = delete;
  PermissionBroker &operator=(const PermissionBroker &) = delete;

  [[nodiscard]] std::future<PermissionResponse> submit(PermissionRequest request) override;
  bool resolve_response(const std::string &id, PermissionResponse response) override;
  [[nodiscard]] std::vector<std::string> list_pending() const override;

  /// Denies every pending request that belongs to `session_id`; returns how many.
  std::size_t cancel_session(const std::string &session_id);
  [[nodiscard]] std::size_t pending_count() const;

private:
  struct Pending {
    std::promise<PermissionResponse> promise;
    std::string session_id;
  };

  std::shared_ptr<events::IEventSink> sink_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Pending> pending_;
};

/// Unattended operation: every request is allowed without suspending.
class AutonomousBroker final : public IPermissionBroker {
public:
  [[nodiscard]] std::future<PermissionResponse> submit(PermissionRequest request) override;
  bool resolve_response(const std::string &, PermissionResponse) override { return false; }
  [[nodiscard]] std::vector<std::string> list_pending() const override { return {}; }
};

} // namespace cowork::permissions
