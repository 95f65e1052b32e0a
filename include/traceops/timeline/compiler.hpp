#pragma once

#include "traceops/config/schema.hpp"
#include "traceops/timeline/correlation.hpp"
#include "traceops/timeline/cost.hpp"
#include "traceops/transcript/record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace traceops::timeline {

enum class EntryKind {
  Action,
  MessageEnd,
  Reasoning,
  UserMessage,
};

struct TimelineEntry {
  EntryKind kind = EntryKind::Action;
  std::optional<std::size_t> sequence;
  std::string text;

  [[nodiscard]] std::string render() const;
};

/// One compiled conversation. The original records ride along so callers
/// can compute conversation-level usage without re-reading the file.
struct CompiledTimeline {
  std::string file_path;
  std::vector<TimelineEntry> entries;
  std::size_t action_count = 0;
  std::vector<transcript::ConversationRecord> records;

  [[nodiscard]] std::string text() const;
};

class TimelineCompiler {
public:
  TimelineCompiler() = default;
  TimelineCompiler(config::TimelineConfig options, CostEstimator costs);

  [[nodiscard]] std::optional<std::vector<TimelineEntry>>
  compile(const std::vector<transcript::ConversationRecord> &records,
          const CorrelationIndex &index) const;

  [[nodiscard]] std::optional<CompiledTimeline>
  compile_conversation(transcript::Conversation conversation) const;

  [[nodiscard]] const config::TimelineConfig &options() const { return options_; }
  [[nodiscard]] const CostEstimator &costs() const { return costs_; }

private:
  config::TimelineConfig options_;
  CostEstimator costs_;
};

[[nodiscard]] std::string summarize_user_message(const std::string &text, std::size_t max_chars);

} // namespace traceops::timeline
