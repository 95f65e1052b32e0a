#include "traceops/observability/factory.hpp"

#include "traceops/common/fs.hpp"
#include "traceops/observability/log_observer.hpp"
#include "traceops/observability/multi_observer.hpp"
#include "traceops/observability/noop_observer.hpp"

#include <sstream>

namespace traceops::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config, const bool verbose) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(verbose);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        multi->add(std::make_unique<LogObserver>(verbose));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>(verbose);
}

} // namespace traceops::observability
