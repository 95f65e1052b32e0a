#include "traceops/transcript/record.hpp"

#include "traceops/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace traceops::transcript {

RecordRole role_from_string(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "user") {
    return RecordRole::User;
  }
  if (normalized == "assistant") {
    return RecordRole::Assistant;
  }
  return RecordRole::Other;
}

std::optional<std::string> ToolUseBlock::input_raw(const std::string &key) const {
  for (const auto &[k, v] : input) {
    if (k == key) {
      return v;
    }
  }
  return std::nullopt;
}

std::optional<std::string> ToolUseBlock::input_string(const std::string &key) const {
  const auto raw = input_raw(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return common::json_string_value(*raw);
}

std::optional<std::int64_t> ToolUseBlock::input_int(const std::string &key) const {
  const auto raw = input_raw(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return common::json_int_value(*raw);
}

std::string ToolUseBlock::input_json() const {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[k, v] : input) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << "\"" << common::json_escape(k) << "\":" << common::json_minify(v);
  }
  out << "}";
  return out.str();
}

bool ConversationRecord::starts_with_thinking() const {
  return !content.empty() && std::holds_alternative<ThinkingBlock>(content.front());
}

std::size_t ConversationRecord::tool_use_count() const {
  return static_cast<std::size_t>(std::count_if(content.begin(), content.end(), [](const auto &b) {
    return std::holds_alternative<ToolUseBlock>(b);
  }));
}

std::optional<std::string> ConversationRecord::first_text() const {
  for (const auto &block : content) {
    if (const auto *text = std::get_if<TextBlock>(&block); text != nullptr && !text->text.empty()) {
      return text->text;
    }
  }
  return std::nullopt;
}

std::optional<Usage> ConversationRecord::billable_usage() const {
  if (usage.has_value() && usage->billable()) {
    return usage;
  }
  return std::nullopt;
}

} // namespace traceops::transcript
