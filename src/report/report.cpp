#include "traceops/report/report.hpp"

#include "traceops/batch/orchestrator.hpp"
#include "traceops/common/time.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <regex>
#include <sstream>

namespace traceops::report {

namespace {

constexpr const char *kSyntheticModel = "<synthetic>";

std::size_t line_count(const std::string &text) {
  return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
}

std::string session_header(const timeline::CompiledTimeline &timeline, const std::size_t index) {
  const std::string stem = timeline.file_path.empty()
                               ? "session-" + std::to_string(index)
                               : std::filesystem::path(timeline.file_path).stem().string();

  std::optional<std::int64_t> first;
  std::optional<std::int64_t> last;
  std::size_t stamped = 0;
  for (const auto &record : timeline.records) {
    const auto parsed = common::parse_timestamp_ms(record.timestamp);
    if (!parsed.has_value()) {
      continue;
    }
    ++stamped;
    first = first.has_value() ? std::min(*first, *parsed) : *parsed;
    last = last.has_value() ? std::max(*last, *parsed) : *parsed;
  }

  std::string header = "### Session " + stem;
  if (first.has_value()) {
    header += " [" + common::format_local_datetime(*first) + "]";
    if (stamped > 1) {
      header += " (" + format_session_duration(*last - *first) + ")";
    }
  }
  return header;
}

} // namespace

UsageSummary aggregate_usage(const std::vector<timeline::CompiledTimeline> &timelines,
                             const timeline::CostEstimator &costs) {
  UsageSummary summary;
  for (const auto &compiled : timelines) {
    for (const auto &record : compiled.records) {
      if (record.role != transcript::RecordRole::Assistant || !record.usage.has_value()) {
        continue;
      }
      summary.input_tokens += record.usage->input_tokens;
      summary.output_tokens += record.usage->output_tokens;
      if (record.model.has_value() && !record.model->empty() && *record.model != kSyntheticModel &&
          std::find(summary.models.begin(), summary.models.end(), *record.model) ==
              summary.models.end()) {
        summary.models.push_back(*record.model);
      }
    }
  }

  const std::string model = summary.models.empty() ? "" : summary.models.front();
  summary.tier = costs.tier_for(model).name;
  summary.cost = costs.breakdown(summary.input_tokens, summary.output_tokens, model);
  return summary;
}

std::vector<std::pair<std::string, std::size_t>>
tool_usage_distribution(const std::vector<timeline::CompiledTimeline> &timelines) {
  static const std::regex tool_line(R"(^\d+\.\s+(\w+):)");

  std::map<std::string, std::size_t> counts;
  for (const auto &compiled : timelines) {
    for (const auto &entry : compiled.entries) {
      const std::string line = entry.render();
      std::smatch match;
      if (std::regex_search(line, match, tool_line)) {
        ++counts[match[1].str()];
      }
    }
  }

  std::vector<std::pair<std::string, std::size_t>> out(counts.begin(), counts.end());
  std::stable_sort(out.begin(), out.end(),
                   [](const auto &lhs, const auto &rhs) { return lhs.second > rhs.second; });
  return out;
}

std::string format_session_duration(const std::int64_t diff_ms) {
  if (diff_ms < 1000) {
    return "<1s";
  }
  if (diff_ms < 60'000) {
    return std::to_string((diff_ms + 500) / 1000) + "s";
  }

  const std::int64_t total_minutes = diff_ms / 60'000;
  if (total_minutes < 60) {
    const std::int64_t seconds = ((diff_ms % 60'000) + 500) / 1000;
    return std::to_string(total_minutes) + "m" +
           (seconds > 0 ? " " + std::to_string(seconds) + "s" : "");
  }

  const std::int64_t hours = total_minutes / 60;
  const std::int64_t minutes = total_minutes % 60;
  return std::to_string(hours) + "h" + (minutes > 0 ? " " + std::to_string(minutes) + "m" : "");
}

std::string generate_report(const std::vector<timeline::CompiledTimeline> &timelines,
                            const timeline::CostEstimator &costs) {
  std::ostringstream out;
  out << "# Conversation History Analysis\n\n";

  std::size_t total_lines = 0;
  for (const auto &compiled : timelines) {
    total_lines += line_count(compiled.text());
  }
  const UsageSummary usage = aggregate_usage(timelines, costs);
  const std::string model = usage.models.empty() ? "unknown" : usage.models.front();

  out << "## Summary\n";
  out << "- Total Conversations: " << timelines.size() << "\n";
  out << "- Total Tool Calls: " << total_lines << "\n";
  out << "- Model: " << model << " (" << usage.tier << " pricing)\n";
  out << "- Input Tokens: " << usage.input_tokens << "\n";
  out << "- Output Tokens: " << usage.output_tokens << "\n";
  out << "- Total Cost: " << timeline::format_cost(usage.cost.total())
      << " (in: " << timeline::format_cost(usage.cost.input)
      << ", out: " << timeline::format_cost(usage.cost.output) << ")\n\n";

  out << "## Tool Usage Distribution\n";
  for (const auto &[tool, count] : tool_usage_distribution(timelines)) {
    out << "- " << tool << ": " << count << " calls\n";
  }
  out << "\n";

  out << "## Extracting Heredoc Commands\n\n";
  out << "Bash commands containing heredocs are shown as references. To extract the full "
         "command:\n\n";
  out << "```bash\n";
  out << "# Conversation logs live under ~/.claude/projects/<project>/*.jsonl\n";
  out << "jq -r '.message.content[]? | select(.type == \"tool_use\" and .id == \"TOOL_ID\") "
         "| .input.command' CONVERSATION_FILE.jsonl\n";
  out << "```\n\n";
  out << "Replace `TOOL_ID` with the id shown in the heredoc reference.\n\n";

  std::vector<std::size_t> order(timelines.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    order[i] = i;
  }
  std::vector<std::int64_t> starts(timelines.size(), 0);
  for (std::size_t i = 0; i < timelines.size(); ++i) {
    starts[i] = batch::earliest_timestamp_ms(timelines[i]).value_or(0);
  }
  std::stable_sort(order.begin(), order.end(),
                   [&starts](const std::size_t lhs, const std::size_t rhs) {
                     return starts[lhs] > starts[rhs];
                   });

  out << "## Sessions\n\n";
  for (const std::size_t index : order) {
    out << session_header(timelines[index], index) << "\n";
    out << timelines[index].text() << "\n\n";
  }
  return out.str();
}

} // namespace traceops::report
