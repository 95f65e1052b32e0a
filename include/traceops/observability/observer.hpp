#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace traceops::observability {

struct BatchStartEvent {
  std::size_t files = 0;
  std::size_t workers = 0;
  std::size_t group_size = 0;
};

struct GroupCompleteEvent {
  std::size_t group_index = 0;
  std::size_t files = 0;
  std::size_t timelines = 0;
  std::chrono::milliseconds duration{0};
};

struct ConversationCompiledEvent {
  std::string file;
  std::size_t entries = 0;
  std::size_t actions = 0;
};

struct FileSkippedEvent {
  std::string file;
  std::string reason;
};

struct UnitFailedEvent {
  std::string file;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<BatchStartEvent, GroupCompleteEvent, ConversationCompiledEvent, FileSkippedEvent,
                 UnitFailedEvent, ErrorEvent>;

struct BatchLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensObservedMetric {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
};

struct ActiveWorkersMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<BatchLatencyMetric, TokensObservedMetric, ActiveWorkersMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace traceops::observability
