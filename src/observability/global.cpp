#include "traceops/observability/global.hpp"

#include <mutex>

namespace traceops::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_batch_start(const std::size_t files, const std::size_t workers,
                        const std::size_t group_size) {
  record_event(BatchStartEvent{.files = files, .workers = workers, .group_size = group_size});
}

void record_group_complete(const std::size_t group_index, const std::size_t files,
                           const std::size_t timelines, const std::chrono::milliseconds duration) {
  record_event(GroupCompleteEvent{.group_index = group_index,
                                  .files = files,
                                  .timelines = timelines,
                                  .duration = duration});
}

void record_conversation_compiled(const std::string &file, const std::size_t entries,
                                  const std::size_t actions) {
  record_event(ConversationCompiledEvent{.file = file, .entries = entries, .actions = actions});
}

void record_file_skipped(const std::string &file, const std::string &reason) {
  record_event(FileSkippedEvent{.file = file, .reason = reason});
}

void record_unit_failed(const std::string &file, const std::string &message) {
  record_event(UnitFailedEvent{.file = file, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace traceops::observability
