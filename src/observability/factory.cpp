#include "cowork/observability/factory.hpp"

#include "cowork/common/fs.hpp"
#include "cowork/observability/log_observer.hpp"
#include "cowork/observability/multi_observer.hpp"

#include <sstream>

namespace cowork::observability {

namespace {

std::unique_ptr<IObserver> single_backend(const std::string &name) {
  if (name == "log") {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<NoopObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.find(',') == std::string::npos) {
    return single_backend(backend.empty() ? "none" : backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      multi->add(single_backend(name));
    }
  }
  return multi;
}

} // namespace cowork::observability
