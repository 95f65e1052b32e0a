#pragma once

#include "traceops/config/schema.hpp"
#include "traceops/observability/observer.hpp"

#include <memory>

namespace traceops::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                                         bool verbose = false);

} // namespace traceops::observability
