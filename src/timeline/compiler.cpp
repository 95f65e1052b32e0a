#include "traceops/timeline/compiler.hpp"

#include "traceops/common/fs.hpp"
#include "traceops/common/time.hpp"
#include "traceops/timeline/elapsed.hpp"
#include "traceops/timeline/formatters.hpp"

#include <utility>
#include <variant>

namespace traceops::timeline {

namespace {

struct FileRun {
  ToolKind kind = ToolKind::Read;
  /// Files in first-seen order, each with its ranges in arrival order.
  std::vector<std::pair<std::string, std::vector<std::string>>> files;
  std::size_t total_bytes = 0;

  void add(const FileOperation &op) {
    for (auto &[name, ranges] : files) {
      if (name == op.filename) {
        ranges.push_back(op.line_range);
        total_bytes += op.bytes;
        return;
      }
    }
    files.push_back({op.filename, {op.line_range}});
    total_bytes += op.bytes;
  }
};

struct ReasoningRun {
  std::size_t count = 1;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
};

struct PendingAction {
  std::variant<FileRun, ReasoningRun> run;
  std::optional<std::int64_t> start_ms;
  std::optional<std::int64_t> end_ms;
  double cost = 0.0;
};

struct CompilerState {
  std::vector<TimelineEntry> entries;
  std::optional<PendingAction> pending;
  std::optional<std::int64_t> last_emit_ms;
  std::size_t next_sequence = 1;
  std::size_t message_number = 0;
  std::optional<std::string> pending_user_message;
};

struct CompileContext {
  const config::TimelineConfig &options;
  const CostEstimator &costs;
  const CorrelationIndex &index;

  [[nodiscard]] std::int64_t max_elapsed_ms() const { return options.max_elapsed_seconds * 1000; }

  [[nodiscard]] bool hidden(const std::string &tool_name) const {
    if (is_external_tool(tool_name)) {
      return false;
    }
    for (const auto &name : options.hidden_tools) {
      if (name == tool_name) {
        return true;
      }
    }
    return false;
  }
};

std::string usage_text(const transcript::Usage &usage, const double cost) {
  return "in=" + std::to_string(usage.input_tokens) + "t out=" +
         std::to_string(usage.output_tokens) + "t " + format_cost(cost);
}

void emit_action(CompilerState &state, std::string text) {
  state.entries.push_back(TimelineEntry{
      .kind = EntryKind::Action, .sequence = state.next_sequence++, .text = std::move(text)});
}

void emit_marker(CompilerState &state, const EntryKind kind, std::string text) {
  state.entries.push_back(TimelineEntry{.kind = kind, .sequence = std::nullopt, .text = std::move(text)});
}

CompilerState flush(CompilerState state, const CompileContext &ctx) {
  if (!state.pending.has_value()) {
    return state;
  }
  PendingAction pending = std::move(*state.pending);
  state.pending.reset();

  std::vector<std::string> parts;
  if (const auto elapsed = elapsed_between(state.last_emit_ms, pending.start_ms, ctx.max_elapsed_ms());
      elapsed.has_value()) {
    parts.push_back("+" + *elapsed);
  }

  if (const auto *reasoning = std::get_if<ReasoningRun>(&pending.run)) {
    if (reasoning->count > 1) {
      parts.push_back(std::to_string(reasoning->count) + "x");
    }
    parts.push_back("in=" + std::to_string(reasoning->input_tokens) + "t");
    parts.push_back("out=" + std::to_string(reasoning->output_tokens) + "t");
    parts.push_back(format_cost(pending.cost));
    std::string meta = bracket(parts);
    meta.pop_back();
    emit_marker(state, EntryKind::Reasoning, "\xF0\x9F\x92\xAD " + meta);
  } else {
    const auto &run = std::get<FileRun>(pending.run);
    parts.push_back(std::to_string(run.total_bytes) + "b");
    parts.push_back(format_cost(pending.cost));
    std::string listing;
    for (const auto &[name, ranges] : run.files) {
      for (const auto &range : ranges) {
        if (!listing.empty()) {
          listing += ", ";
        }
        listing += name + "[" + range + "]";
      }
    }
    emit_action(state, std::string(tool_kind_label(run.kind)) + ": " + bracket(parts) + listing);
  }

  state.last_emit_ms = pending.end_ms.has_value() ? pending.end_ms : pending.start_ms;
  return state;
}

/// Flushes the open run first so the user message lands after it.
CompilerState insert_user_message(CompilerState state, const CompileContext &ctx) {
  if (!state.pending_user_message.has_value()) {
    return state;
  }
  state = flush(std::move(state), ctx);
  emit_marker(state, EntryKind::UserMessage, std::move(*state.pending_user_message));
  state.pending_user_message.reset();
  return state;
}

CompilerState step_user(CompilerState state, const transcript::ConversationRecord &record,
                        const CompileContext &ctx) {
  if (const auto text = record.first_text(); text.has_value()) {
    auto message = summarize_user_message(*text, ctx.options.user_message_max_chars);
    if (!message.empty()) {
      state.pending_user_message = std::move(message);
    }
  }
  return state;
}

CompilerState step_reasoning(CompilerState state, const transcript::ConversationRecord &record,
                             const CompileContext &ctx) {
  const auto usage = record.billable_usage();
  if (!usage.has_value()) {
    return state;
  }

  const auto timestamp = common::parse_timestamp_ms(record.timestamp);
  const std::int64_t gap_ms = state.last_emit_ms.has_value() && timestamp.has_value()
                                  ? *timestamp - *state.last_emit_ms
                                  : 0;
  if (gap_ms > ctx.options.reasoning_idle_gap_seconds * 1000) {
    return state;
  }

  const double cost =
      ctx.costs.estimate(usage->input_tokens, usage->output_tokens, record.model.value_or(""));

  if (state.pending.has_value()) {
    if (auto *run = std::get_if<ReasoningRun>(&state.pending->run)) {
      run->count += 1;
      run->input_tokens += usage->input_tokens;
      run->output_tokens += usage->output_tokens;
      state.pending->cost += cost;
      state.pending->end_ms = timestamp;
      return state;
    }
  }

  state = flush(std::move(state), ctx);
  state.pending = PendingAction{
      .run = ReasoningRun{.count = 1,
                          .input_tokens = usage->input_tokens,
                          .output_tokens = usage->output_tokens},
      .start_ms = timestamp,
      .end_ms = timestamp,
      .cost = cost,
  };
  return state;
}

CompilerState absorb_file_operation(CompilerState state, const ToolKind kind,
                                    const FileOperation &op, const double cost,
                                    const std::optional<std::int64_t> timestamp,
                                    const CompileContext &ctx) {
  if (state.pending.has_value()) {
    if (auto *run = std::get_if<FileRun>(&state.pending->run); run != nullptr && run->kind == kind) {
      run->add(op);
      state.pending->cost += cost;
      state.pending->end_ms = timestamp;
      return state;
    }
  }

  state = flush(std::move(state), ctx);
  FileRun run{.kind = kind, .files = {}, .total_bytes = 0};
  run.add(op);
  state.pending = PendingAction{
      .run = std::move(run),
      .start_ms = timestamp,
      .end_ms = timestamp,
      .cost = cost,
  };
  return state;
}

CompilerState step_assistant(CompilerState state, const transcript::ConversationRecord &record,
                             const CompileContext &ctx) {
  ++state.message_number;

  const auto usage = record.billable_usage();
  const double cost = usage.has_value() ? ctx.costs.estimate(usage->input_tokens,
                                                             usage->output_tokens,
                                                             record.model.value_or(""))
                                        : 0.0;
  const auto timestamp = common::parse_timestamp_ms(record.timestamp);
  const std::size_t tool_count = record.tool_use_count();
  const bool inline_usage = tool_count == 1;
  bool produced = false;

  for (const auto &block : record.content) {
    const auto *tool = std::get_if<transcript::ToolUseBlock>(&block);
    if (tool == nullptr || ctx.hidden(tool->name)) {
      continue;
    }
    const ToolKind kind = classify_tool(tool->name);
    const transcript::ToolResultBlock *result = ctx.index.find(tool->id);

    if (is_file_operation(kind)) {
      const FileOperation op = describe_file_operation(kind, *tool, result);
      if (kind == ToolKind::Read && op.bytes < ctx.options.read_size_threshold) {
        continue;
      }
      state = insert_user_message(std::move(state), ctx);
      state = absorb_file_operation(std::move(state), kind, op, cost, timestamp, ctx);
      produced = true;
      continue;
    }

    state = insert_user_message(std::move(state), ctx);
    state = flush(std::move(state), ctx);

    ActionMetadata metadata;
    metadata.elapsed = elapsed_between(state.last_emit_ms, timestamp, ctx.max_elapsed_ms());
    if (inline_usage && usage.has_value()) {
      metadata.usage = usage_text(*usage, cost);
    }
    emit_action(state, format_action(kind, *tool, result, metadata));
    if (timestamp.has_value()) {
      state.last_emit_ms = timestamp;
    }
    produced = true;
  }

  if (tool_count > 1 && produced && usage.has_value()) {
    state = flush(std::move(state), ctx);
    std::vector<std::string> parts;
    if (const auto elapsed = elapsed_between(state.last_emit_ms, timestamp, ctx.max_elapsed_ms());
        elapsed.has_value()) {
      parts.push_back("+" + *elapsed);
    }
    parts.push_back(usage_text(*usage, cost));
    std::string meta = bracket(parts);
    meta.pop_back();
    emit_marker(state, EntryKind::MessageEnd,
                "MessageEnd #" + std::to_string(state.message_number) + ": " + meta);
    if (timestamp.has_value()) {
      state.last_emit_ms = timestamp;
    }
  }
  return state;
}

CompilerState step(CompilerState state, const transcript::ConversationRecord &record,
                   const CompileContext &ctx) {
  switch (record.role) {
  case transcript::RecordRole::User:
    return step_user(std::move(state), record, ctx);
  case transcript::RecordRole::Assistant:
    if (record.starts_with_thinking()) {
      return step_reasoning(std::move(state), record, ctx);
    }
    return step_assistant(std::move(state), record, ctx);
  case transcript::RecordRole::Other:
    break;
  }
  return state;
}

} // namespace

std::string TimelineEntry::render() const {
  switch (kind) {
  case EntryKind::Action:
    return std::to_string(sequence.value_or(0)) + ". " + text;
  case EntryKind::UserMessage:
    return "\nUser: " + text + "\n";
  case EntryKind::MessageEnd:
  case EntryKind::Reasoning:
    break;
  }
  return text;
}

std::string CompiledTimeline::text() const {
  std::string out;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out += entries[i].render();
  }
  return out;
}

std::string summarize_user_message(const std::string &text, const std::size_t max_chars) {
  return common::truncate_ellipsis(common::collapse_whitespace(text), max_chars);
}

TimelineCompiler::TimelineCompiler(config::TimelineConfig options, CostEstimator costs)
    : options_(std::move(options)), costs_(std::move(costs)) {}

std::optional<std::vector<TimelineEntry>>
TimelineCompiler::compile(const std::vector<transcript::ConversationRecord> &records,
                          const CorrelationIndex &index) const {
  const CompileContext ctx{.options = options_, .costs = costs_, .index = index};

  CompilerState state;
  for (const auto &record : records) {
    state = step(std::move(state), record, ctx);
  }
  state = flush(std::move(state), ctx);

  if (state.entries.empty()) {
    return std::nullopt;
  }
  return std::move(state.entries);
}

std::optional<CompiledTimeline>
TimelineCompiler::compile_conversation(transcript::Conversation conversation) const {
  const CorrelationIndex index = CorrelationIndex::build(conversation.records);
  auto entries = compile(conversation.records, index);
  if (!entries.has_value()) {
    return std::nullopt;
  }

  CompiledTimeline timeline;
  timeline.file_path = std::move(conversation.file_path);
  timeline.entries = std::move(*entries);
  for (const auto &entry : timeline.entries) {
    if (entry.kind == EntryKind::Action) {
      ++timeline.action_count;
    }
  }
  timeline.records = std::move(conversation.records);
  return timeline;
}

} // namespace traceops::timeline
