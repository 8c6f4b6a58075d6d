#pragma once

#include "cowork/config/schema.hpp"
#include "cowork/observability/observer.hpp"

#include <memory>

namespace cowork::observability {

/// Backend "none"/"noop", "log", or a comma list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace cowork::observability
