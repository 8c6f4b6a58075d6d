#include "cowork/permissions/manager.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/observability/global.hpp"

namespace cowork::permissions {

PermissionManager::PermissionManager(std::shared_ptr<IPermissionHandler> handler,
                                     const bool cache_allow_always)
    : handler_(std::move(handler)), cache_allow_always_(cache_allow_always) {}

common::Result<bool> PermissionManager::check(const PermissionRequest &request) {
  const std::string key = request.cache_key();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = cache_.find(key); it != cache_.end()) {
      return common::Result<bool>::success(it->second);
    }
  }

  auto response = this->request(request);
  if (!response.ok()) {
    return common::Result<bool>::failure(response.error());
  }

  const bool allowed = is_allowed(response.value());
  if (cache_allow_always_ && should_cache(response.value())) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[key] = true;
  }
  observability::record_permission_decision(std::string(to_string(request.permission_type)),
                                            request.resource(), allowed);
  return common::Result<bool>::success(allowed);
}

common::Result<PermissionResponse> PermissionManager::request(const PermissionRequest &request) {
  if (!handler_) {
    return common::Result<PermissionResponse>::failure("no permission handler configured");
  }
  return handler_->request_permission(request);
}

void PermissionManager::pre_approve(const std::string &cache_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_[cache_key] = true;
}

void PermissionManager::clear_cache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

void PermissionManager::clear_session_cache(const std::string &session_id) {
  const std::string prefix = session_id + ":";
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (common::starts_with(it->first, prefix)) {
      it = cache_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t PermissionManager::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

} // namespace cowork::permissions
