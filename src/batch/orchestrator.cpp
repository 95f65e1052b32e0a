#include "traceops/batch/orchestrator.hpp"

#include "traceops/common/fs.hpp"
#include "traceops/common/time.hpp"
#include "traceops/observability/global.hpp"
#include "traceops/transcript/parser.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <mutex>

namespace traceops::batch {

namespace {

struct PendingUnit {
  std::mutex mutex;
  std::condition_variable cv;
  bool complete = false;
  std::optional<timeline::CompiledTimeline> timeline;
  std::optional<std::string> error;
};

std::string timeout_message(const std::chrono::milliseconds timeout) {
  return "unit timed out after " + std::to_string(timeout.count()) + "ms";
}

std::chrono::milliseconds since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

void record_token_totals(const timeline::CompiledTimeline &timeline) {
  std::uint64_t input = 0;
  std::uint64_t output = 0;
  for (const auto &record : timeline.records) {
    if (record.role != transcript::RecordRole::Assistant) {
      continue;
    }
    if (const auto usage = record.billable_usage(); usage.has_value()) {
      input += usage->input_tokens;
      output += usage->output_tokens;
    }
  }
  observability::record_metric(
      observability::TokensObservedMetric{.input_tokens = input, .output_tokens = output});
}

} // namespace

common::Result<FailurePolicy> failure_policy_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "abort_group" || normalized.empty()) {
    return common::Result<FailurePolicy>::success(FailurePolicy::AbortGroup);
  }
  if (normalized == "isolate") {
    return common::Result<FailurePolicy>::success(FailurePolicy::Isolate);
  }
  return common::Result<FailurePolicy>::failure("Unknown failure policy: " + value);
}

std::string failure_policy_to_string(const FailurePolicy policy) {
  switch (policy) {
  case FailurePolicy::AbortGroup:
    return "abort_group";
  case FailurePolicy::Isolate:
    return "isolate";
  }
  return "abort_group";
}

common::Result<BatchOptions> BatchOptions::from_config(const config::BatchConfig &config) {
  const auto policy = failure_policy_from_string(config.failure_policy);
  if (!policy.ok()) {
    return common::Result<BatchOptions>::failure(policy.error());
  }
  if (config.parse_group_size == 0) {
    return common::Result<BatchOptions>::failure("parse group size must be positive");
  }

  BatchOptions options;
  options.parse_group_size = config.parse_group_size;
  options.concurrency = config.concurrency;
  options.max_workers = config.max_workers;
  options.unit_timeout = std::chrono::seconds(config.unit_timeout_seconds);
  options.failure_policy = policy.value();
  return common::Result<BatchOptions>::success(options);
}

std::size_t resolve_worker_count(const std::size_t concurrency, const std::size_t max_workers,
                                 const unsigned hardware_threads) {
  if (concurrency > 0) {
    return concurrency;
  }
  const std::size_t spare = hardware_threads > 1 ? hardware_threads - 1 : 0;
  const std::size_t derived = std::max<std::size_t>(2, spare);
  return std::max<std::size_t>(1, std::min(max_workers, derived));
}

BatchOrchestrator::BatchOrchestrator(BatchOptions options, timeline::TimelineCompiler compiler)
    : BatchOrchestrator(options, [compiler = std::move(compiler)](
                                     transcript::Conversation conversation) {
        return compiler.compile_conversation(std::move(conversation));
      }) {}

struct BatchOrchestrator::UnitSlots {
  std::mutex mutex;
  std::condition_variable cv;
  std::size_t live = 0;
};

BatchOrchestrator::BatchOrchestrator(BatchOptions options, CompileFn compile)
    : options_(options), compile_(std::move(compile)),
      workers_(resolve_worker_count(options.concurrency, options.max_workers)),
      slots_(std::make_shared<UnitSlots>()) {
  if (options_.parse_group_size == 0) {
    options_.parse_group_size = 1;
  }
}

BatchOrchestrator::~BatchOrchestrator() {
  if (!slots_) {
    return;
  }
  std::unique_lock<std::mutex> lock(slots_->mutex);
  slots_->cv.wait(lock, [this]() { return slots_->live == 0; });
}

std::vector<transcript::Conversation>
BatchOrchestrator::parse_group(const std::vector<std::filesystem::path> &files,
                               const std::size_t begin, const std::size_t end,
                               BatchResult &result) const {
  std::vector<std::future<common::Result<transcript::Conversation>>> futures;
  futures.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    futures.push_back(std::async(std::launch::async, [path = files[i]]() {
      return transcript::load_conversation_file(path);
    }));
  }

  std::vector<transcript::Conversation> conversations;
  conversations.reserve(futures.size());
  for (std::size_t i = 0; i < futures.size(); ++i) {
    auto loaded = futures[i].get();
    const std::string path = files[begin + i].string();
    if (!loaded.ok()) {
      ++result.files_skipped;
      observability::record_file_skipped(path, loaded.error());
      continue;
    }
    if (loaded.value().records.empty()) {
      ++result.files_skipped;
      observability::record_file_skipped(path, "no valid records");
      continue;
    }
    conversations.push_back(std::move(loaded.value()));
  }
  return conversations;
}

std::vector<BatchOrchestrator::UnitOutcome>
BatchOrchestrator::compile_group(std::vector<transcript::Conversation> conversations) const {
  std::vector<std::string> paths;
  std::vector<std::future<std::optional<timeline::CompiledTimeline>>> futures;
  paths.reserve(conversations.size());
  futures.reserve(conversations.size());

  for (auto &conversation : conversations) {
    paths.push_back(conversation.file_path);
    futures.push_back(std::async(std::launch::async,
                                 [compile = compile_, conversation = std::move(conversation)]() mutable {
                                   return compile(std::move(conversation));
                                 }));
  }

  std::vector<UnitOutcome> outcomes;
  outcomes.reserve(futures.size());
  for (std::size_t i = 0; i < futures.size(); ++i) {
    UnitOutcome outcome;
    outcome.file_path = paths[i];
    try {
      outcome.timeline = futures[i].get();
    } catch (const std::exception &ex) {
      outcome.failure = UnitFailure{.file_path = paths[i], .message = ex.what(), .timed_out = false};
    } catch (...) {
      outcome.failure =
          UnitFailure{.file_path = paths[i], .message = "unknown exception", .timed_out = false};
    }
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

std::vector<BatchOrchestrator::UnitOutcome>
BatchOrchestrator::compile_group_with_timeout(
    std::vector<transcript::Conversation> conversations) const {
  const auto deadline = std::chrono::steady_clock::now() + options_.unit_timeout;
  std::vector<std::string> paths;
  std::vector<std::shared_ptr<PendingUnit>> pending;
  paths.reserve(conversations.size());
  pending.reserve(conversations.size());

  for (auto &conversation : conversations) {
    paths.push_back(conversation.file_path);
    // A unit abandoned by an earlier group still holds its slot, so at most
    // workers_ units run at once. No free slot before the deadline is a timeout.
    {
      std::unique_lock<std::mutex> lock(slots_->mutex);
      if (!slots_->cv.wait_until(lock, deadline, [this]() { return slots_->live < workers_; })) {
        pending.push_back(nullptr);
        continue;
      }
      ++slots_->live;
    }

    auto unit = std::make_shared<PendingUnit>();
    pending.push_back(unit);
    // Detached so a runaway unit cannot hold the group past its deadline.
    std::thread([unit, slots = slots_, compile = compile_,
                 conversation = std::move(conversation)]() mutable {
      std::optional<timeline::CompiledTimeline> timeline;
      std::optional<std::string> error;
      try {
        timeline = compile(std::move(conversation));
      } catch (const std::exception &ex) {
        error = ex.what();
      } catch (...) {
        error = "unknown exception";
      }
      {
        std::lock_guard<std::mutex> lock(unit->mutex);
        unit->timeline = std::move(timeline);
        unit->error = std::move(error);
        unit->complete = true;
        unit->cv.notify_all();
      }
      std::lock_guard<std::mutex> lock(slots->mutex);
      --slots->live;
      slots->cv.notify_all();
    }).detach();
  }

  std::vector<UnitOutcome> outcomes;
  outcomes.reserve(pending.size());
  for (std::size_t i = 0; i < pending.size(); ++i) {
    UnitOutcome outcome;
    outcome.file_path = paths[i];
    if (pending[i] == nullptr) {
      outcome.failure = UnitFailure{
          .file_path = paths[i], .message = timeout_message(options_.unit_timeout), .timed_out = true};
      outcomes.push_back(std::move(outcome));
      continue;
    }
    std::unique_lock<std::mutex> lock(pending[i]->mutex);
    const bool done =
        pending[i]->cv.wait_until(lock, deadline, [&]() { return pending[i]->complete; });
    if (!done) {
      outcome.failure = UnitFailure{
          .file_path = paths[i], .message = timeout_message(options_.unit_timeout), .timed_out = true};
    } else if (pending[i]->error.has_value()) {
      outcome.failure =
          UnitFailure{.file_path = paths[i], .message = *pending[i]->error, .timed_out = false};
    } else {
      outcome.timeline = std::move(pending[i]->timeline);
    }
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

BatchResult BatchOrchestrator::run(const std::vector<std::filesystem::path> &files) const {
  BatchResult result;
  result.files_total = files.size();
  observability::record_batch_start(files.size(), workers_, options_.parse_group_size);

  const auto batch_start = std::chrono::steady_clock::now();
  std::size_t group_index = 0;
  for (std::size_t begin = 0; begin < files.size(); begin += options_.parse_group_size) {
    const auto group_start = std::chrono::steady_clock::now();
    const std::size_t end = std::min(files.size(), begin + options_.parse_group_size);
    auto conversations = parse_group(files, begin, end, result);
    const std::size_t timelines_before = result.timelines.size();

    for (std::size_t offset = 0; offset < conversations.size(); offset += workers_) {
      const std::size_t stop = std::min(conversations.size(), offset + workers_);
      std::vector<transcript::Conversation> units(
          std::make_move_iterator(conversations.begin() + static_cast<std::ptrdiff_t>(offset)),
          std::make_move_iterator(conversations.begin() + static_cast<std::ptrdiff_t>(stop)));

      observability::record_metric(
          observability::ActiveWorkersMetric{.count = static_cast<std::uint64_t>(units.size())});
      auto outcomes = options_.unit_timeout.count() > 0
                          ? compile_group_with_timeout(std::move(units))
                          : compile_group(std::move(units));

      const bool any_failed =
          std::any_of(outcomes.begin(), outcomes.end(),
                      [](const UnitOutcome &outcome) { return outcome.failure.has_value(); });
      if (any_failed && options_.failure_policy == FailurePolicy::AbortGroup) {
        ++result.groups_aborted;
      }

      for (auto &outcome : outcomes) {
        if (outcome.failure.has_value()) {
          observability::record_unit_failed(outcome.failure->file_path, outcome.failure->message);
          result.failures.push_back(std::move(*outcome.failure));
          continue;
        }
        if (any_failed && options_.failure_policy == FailurePolicy::AbortGroup) {
          continue;
        }
        if (!outcome.timeline.has_value()) {
          ++result.empty_conversations;
          continue;
        }
        observability::record_conversation_compiled(outcome.timeline->file_path,
                                                    outcome.timeline->entries.size(),
                                                    outcome.timeline->action_count);
        record_token_totals(*outcome.timeline);
        result.timelines.push_back(std::move(*outcome.timeline));
      }
    }

    observability::record_group_complete(group_index++, end - begin,
                                         result.timelines.size() - timelines_before,
                                         since(group_start));
  }

  observability::record_metric(observability::BatchLatencyMetric{.latency = since(batch_start)});
  return result;
}

std::optional<std::int64_t> earliest_timestamp_ms(const timeline::CompiledTimeline &timeline) {
  std::optional<std::int64_t> earliest;
  for (const auto &record : timeline.records) {
    const auto parsed = common::parse_timestamp_ms(record.timestamp);
    if (parsed.has_value() && (!earliest.has_value() || *parsed < *earliest)) {
      earliest = parsed;
    }
  }
  return earliest;
}

void sort_by_earliest_timestamp(std::vector<timeline::CompiledTimeline> &timelines,
                                const bool newest_first) {
  std::vector<std::pair<std::optional<std::int64_t>, timeline::CompiledTimeline>> keyed;
  keyed.reserve(timelines.size());
  for (auto &timeline : timelines) {
    auto key = earliest_timestamp_ms(timeline);
    keyed.emplace_back(key, std::move(timeline));
  }

  std::stable_sort(keyed.begin(), keyed.end(), [newest_first](const auto &lhs, const auto &rhs) {
    if (lhs.first.has_value() != rhs.first.has_value()) {
      return lhs.first.has_value();
    }
    if (lhs.first.has_value() && *lhs.first != *rhs.first) {
      return newest_first ? *lhs.first > *rhs.first : *lhs.first < *rhs.first;
    }
    return lhs.second.file_path < rhs.second.file_path;
  });

  timelines.clear();
  for (auto &[key, timeline] : keyed) {
    (void)key;
    timelines.push_back(std::move(timeline));
  }
}

} // namespace traceops::batch
