#pragma once

#include "cowork/common/result.hpp"
#include "cowork/permissions/handler.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cowork::permissions {

/// Caches AllowAlways decisions by PermissionRequest::cache_key and delegates the rest.
class PermissionManager {
public:
  explicit PermissionManager(std::shared_ptr<IPermissionHandler> handler,
                             bool cache_allow_always = true);

  /// Cached decision when present, otherwise the handler's answer.
  [[nodiscard]] common::Result<bool> check(const PermissionRequest &request);

  /// Uncached round trip to the handler.
  [[nodiscard]] common::Result<PermissionResponse> request(const PermissionRequest &request);

  void pre_approve(const std::string &cache_key);
  void clear_cache();
  void clear_session_cache(const std::string &session_id);
  [[nodiscard]] std::size_t cache_size() const;

private:
  std::shared_ptr<IPermissionHandler> handler_;
  bool cache_allow_always_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, bool> cache_;
};

} // namespace cowork::permissions
