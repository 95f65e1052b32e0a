#pragma once

#include "traceops/observability/observer.hpp"

#include <mutex>

namespace traceops::observability {

class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false) : verbose_(verbose) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  bool verbose_;
  std::mutex mutex_;
};

} // namespace traceops::observability
