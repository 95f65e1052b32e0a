#pragma once

#include "traceops/common/result.hpp"
#include "traceops/config/schema.hpp"
#include "traceops/timeline/compiler.hpp"
#include "traceops/transcript/record.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace traceops::batch {

enum class FailurePolicy {
  AbortGroup,
  Isolate,
};

[[nodiscard]] common::Result<FailurePolicy> failure_policy_from_string(const std::string &value);
[[nodiscard]] std::string failure_policy_to_string(FailurePolicy policy);

struct BatchOptions {
  std::size_t parse_group_size = 50;
  std::size_t concurrency = 0;
  std::size_t max_workers = 16;
  std::chrono::milliseconds unit_timeout{0};
  FailurePolicy failure_policy = FailurePolicy::AbortGroup;

  [[nodiscard]] static common::Result<BatchOptions> from_config(const config::BatchConfig &config);
};

struct UnitFailure {
  std::string file_path;
  std::string message;
  bool timed_out = false;
};

struct BatchResult {
  std::vector<timeline::CompiledTimeline> timelines;
  std::vector<UnitFailure> failures;
  std::size_t files_total = 0;
  std::size_t files_skipped = 0;
  std::size_t empty_conversations = 0;
  std::size_t groups_aborted = 0;
};

[[nodiscard]] std::size_t resolve_worker_count(std::size_t concurrency, std::size_t max_workers,
                                               unsigned hardware_threads =
                                                   std::thread::hardware_concurrency());

class BatchOrchestrator {
public:
  using CompileFn =
      std::function<std::optional<timeline::CompiledTimeline>(transcript::Conversation)>;

  BatchOrchestrator(BatchOptions options, timeline::TimelineCompiler compiler);
  BatchOrchestrator(BatchOptions options, CompileFn compile);
  /// Blocks until every unit started by a timed run has returned.
  ~BatchOrchestrator();

  /// Parses files in groups of parse_group_size, then compiles each group's
  /// conversations worker_count() at a time, waiting for every unit of an
  /// inner group before starting the next.
  [[nodiscard]] BatchResult run(const std::vector<std::filesystem::path> &files) const;

  [[nodiscard]] std::size_t worker_count() const { return workers_; }
  [[nodiscard]] const BatchOptions &options() const { return options_; }

private:
  struct UnitSlots;

  struct UnitOutcome {
    std::string file_path;
    std::optional<timeline::CompiledTimeline> timeline;
    std::optional<UnitFailure> failure;
  };

  [[nodiscard]] std::vector<transcript::Conversation>
  parse_group(const std::vector<std::filesystem::path> &files, std::size_t begin, std::size_t end,
              BatchResult &result) const;
  [[nodiscard]] std::vector<UnitOutcome>
  compile_group(std::vector<transcript::Conversation> conversations) const;
  [[nodiscard]] std::vector<UnitOutcome>
  compile_group_with_timeout(std::vector<transcript::Conversation> conversations) const;

  BatchOptions options_;
  CompileFn compile_;
  std::size_t workers_ = 2;
  // Units still running, including ones abandoned after their deadline.
  std::shared_ptr<UnitSlots> slots_;
};

[[nodiscard]] std::optional<std::int64_t>
earliest_timestamp_ms(const timeline::CompiledTimeline &timeline);

/// Stable chronological order (or newest first). Conversations without a
/// timestamp go last; ties fall back to the file path.
void sort_by_earliest_timestamp(std::vector<timeline::CompiledTimeline> &timelines,
                                bool newest_first = false);

} // namespace traceops::batch
