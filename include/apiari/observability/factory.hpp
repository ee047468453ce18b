#pragma once

#include "apiari/config/schema.hpp"
#include "apiari/observability/observer.hpp"

#include <memory>

namespace apiari::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace apiari::observability
