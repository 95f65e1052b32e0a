#pragma once

#include "traceops/observability/observer.hpp"

#include <memory>

namespace traceops::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_batch_start(std::size_t files, std::size_t workers, std::size_t group_size);
void record_group_complete(std::size_t group_index, std::size_t files, std::size_t timelines,
                           std::chrono::milliseconds duration);
void record_conversation_compiled(const std::string &file, std::size_t entries,
                                  std::size_t actions);
void record_file_skipped(const std::string &file, const std::string &reason);
void record_unit_failed(const std::string &file, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace traceops::observability
