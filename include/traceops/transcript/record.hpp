#pragma once

#include "traceops/common/json_util.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace traceops::transcript {

enum class RecordRole {
  User,
  Assistant,
  Other,
};

[[nodiscard]] RecordRole role_from_string(std::string_view value);

struct TextBlock {
  std::string text;
};

struct ThinkingBlock {
  std::string thinking;
};

struct ToolUseBlock {
  std::string id;
  std::string name;
  common::JsonMembers input;

  [[nodiscard]] std::optional<std::string> input_string(const std::string &key) const;
  [[nodiscard]] std::optional<std::int64_t> input_int(const std::string &key) const;
  [[nodiscard]] std::optional<std::string> input_raw(const std::string &key) const;
  [[nodiscard]] std::string input_json() const;
};

/// Payload of a tool result: plain text, or structured content kept in its
/// compact serialized form.
struct ToolResultContent {
  std::optional<std::string> text;
  std::string serialized;

  [[nodiscard]] bool is_text() const { return text.has_value(); }
  [[nodiscard]] std::size_t byte_size() const { return text ? text->size() : serialized.size(); }
  [[nodiscard]] bool empty() const { return byte_size() == 0; }
  [[nodiscard]] const std::string &display() const { return text ? *text : serialized; }
};

struct ToolResultBlock {
  std::string tool_use_id;
  ToolResultContent content;
  std::optional<std::int64_t> exit_code;
};

using ContentBlock = std::variant<TextBlock, ThinkingBlock, ToolUseBlock, ToolResultBlock>;

struct Usage {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;

  /// Usage only counts toward cost when both directions were reported.
  [[nodiscard]] bool billable() const { return input_tokens > 0 && output_tokens > 0; }
};

struct ConversationRecord {
  RecordRole role = RecordRole::Other;
  std::string timestamp;
  std::vector<ContentBlock> content;
  std::optional<Usage> usage;
  std::optional<std::string> model;

  [[nodiscard]] bool starts_with_thinking() const;
  [[nodiscard]] std::size_t tool_use_count() const;
  [[nodiscard]] std::optional<std::string> first_text() const;
  [[nodiscard]] std::optional<Usage> billable_usage() const;
};

struct Conversation {
  std::string file_path;
  std::vector<ConversationRecord> records;
};

} // namespace traceops::transcript
