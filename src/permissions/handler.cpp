#include "cowork/permissions/handler.hpp"

namespace cowork::permissions {

BrokerHandler::BrokerHandler(std::shared_ptr<IPermissionBroker> broker)
    : broker_(std::move(broker)) {}

common::Result<PermissionResponse> BrokerHandler::request_permission(const PermissionRequest &request) {
  if (!broker_) {
    return common::Result<PermissionResponse>::failure("no permission broker configured");
  }
  auto future = broker_->submit(request);
  return common::Result<PermissionResponse>::success(future.get());
}

} // namespace cowork::permissions
