#pragma once

#include "cowork/common/result.hpp"
#include "cowork/permissions/broker.hpp"
#include "cowork/permissions/types.hpp"

#include <memory>

namespace cowork::permissions {

/// How a front end answers permission requests.
class IPermissionHandler {
public:
  virtual ~IPermissionHandler() = default;
  [[nodiscard]] virtual common::Result<PermissionResponse>
  request_permission(const PermissionRequest &request) = 0;
};

class AllowAllHandler final : public IPermissionHandler {
public:
  [[nodiscard]] common::Result<PermissionResponse>
  request_permission(const PermissionRequest &) override {
    return common::Result<PermissionResponse>::success(PermissionResponse::Allow);
  }
};

class DenyAllHandler final : public IPermissionHandler {
public:
  [[nodiscard]] common::Result<PermissionResponse>
  request_permission(const PermissionRequest &) override {
    return common::Result<PermissionResponse>::success(PermissionResponse::Deny);
  }
};

/// Suspends on a broker until someone resolves the request.
class BrokerHandler final : public IPermissionHandler {
public:
  explicit BrokerHandler(std::shared_ptr<IPermissionBroker> broker);

  [[nodiscard]] common::Result<PermissionResponse>
  request_permission(const PermissionRequest &request) override;

  [[nodiscard]] IPermissionBroker &broker() { return *broker_; }

private:
  std::shared_ptr<IPermissionBroker> broker_;
};

} // namespace cowork::permissions
