#pragma once

#include "gembridge/config/schema.hpp"
#include "gembridge/observability/observer.hpp"

#include <memory>

namespace gembridge::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace gembridge::observability
