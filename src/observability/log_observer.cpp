#include "traceops/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace traceops::observability {

void LogObserver::log_line(const std::string &level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, BatchStartEvent>) {
          log_line("INFO", "batch.start files=" + std::to_string(evt.files) +
                               " workers=" + std::to_string(evt.workers) +
                               " group_size=" + std::to_string(evt.group_size));
        } else if constexpr (std::is_same_v<T, GroupCompleteEvent>) {
          log_line("DEBUG", "batch.group index=" + std::to_string(evt.group_index) +
                                " files=" + std::to_string(evt.files) +
                                " timelines=" + std::to_string(evt.timelines) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ConversationCompiledEvent>) {
          log_line("DEBUG", "timeline.compiled file=" + evt.file +
                                " entries=" + std::to_string(evt.entries) +
                                " actions=" + std::to_string(evt.actions));
        } else if constexpr (std::is_same_v<T, FileSkippedEvent>) {
          log_line("WARN", "file.skipped file=" + evt.file + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, UnitFailedEvent>) {
          log_line("ERROR", "unit.failed file=" + evt.file + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BatchLatencyMetric>) {
          log_line("DEBUG", "metric.batch_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokensObservedMetric>) {
          log_line("DEBUG", "metric.tokens input=" + std::to_string(m.input_tokens) +
                                " output=" + std::to_string(m.output_tokens));
        } else if constexpr (std::is_same_v<T, ActiveWorkersMetric>) {
          log_line("DEBUG", "metric.active_workers=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace traceops::observability
