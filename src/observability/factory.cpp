#include "gembridge/observability/factory.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/observability/log_observer.hpp"
#include "gembridge/observability/noop_observer.hpp"

namespace gembridge::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop" || backend == "off") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace gembridge::observability
