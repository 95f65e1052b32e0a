#include "traceops/transcript/parser.hpp"

#include "traceops/common/fs.hpp"
#include "traceops/common/json_util.hpp"

#include <sstream>

namespace traceops::transcript {

namespace {

ToolResultContent parse_result_content(const std::string &raw) {
  ToolResultContent content;
  if (raw.empty() || raw == "null") {
    content.text = "";
    return content;
  }
  if (auto text = common::json_string_value(raw); text.has_value()) {
    content.text = std::move(*text);
    return content;
  }
  content.serialized = common::json_minify(raw);
  return content;
}

std::optional<ContentBlock> parse_block(const std::string &raw) {
  const auto members = common::json_object_members(raw);
  if (!members.has_value()) {
    return std::nullopt;
  }
  const std::string type = common::json_get_string(raw, "type");
  if (type == "text") {
    return TextBlock{.text = common::json_get_string(raw, "text")};
  }
  if (type == "thinking") {
    return ThinkingBlock{.thinking = common::json_get_string(raw, "thinking")};
  }
  if (type == "tool_use") {
    ToolUseBlock block;
    block.id = common::json_get_string(raw, "id");
    block.name = common::json_get_string(raw, "name");
    if (const std::string input = common::json_get_object(raw, "input"); !input.empty()) {
      block.input = common::json_object_members(input).value_or(common::JsonMembers{});
    }
    return block;
  }
  if (type == "tool_result") {
    ToolResultBlock block;
    block.tool_use_id = common::json_get_string(raw, "tool_use_id");
    block.content = parse_result_content(common::json_get_raw(raw, "content"));
    block.exit_code = common::json_get_int(raw, "exit_code");
    return block;
  }
  return std::nullopt;
}

std::vector<ContentBlock> parse_content(const std::string &raw) {
  std::vector<ContentBlock> blocks;
  if (auto text = common::json_string_value(raw); text.has_value()) {
    blocks.emplace_back(TextBlock{.text = std::move(*text)});
    return blocks;
  }
  const auto elements = common::json_array_elements(raw);
  if (!elements.has_value()) {
    return blocks;
  }
  for (const auto &element : *elements) {
    if (auto block = parse_block(element); block.has_value()) {
      blocks.push_back(std::move(*block));
    }
  }
  return blocks;
}

std::optional<Usage> parse_usage(const std::string &raw) {
  if (raw.empty()) {
    return std::nullopt;
  }
  Usage usage;
  const auto input = common::json_get_int(raw, "input_tokens");
  const auto output = common::json_get_int(raw, "output_tokens");
  usage.input_tokens = input.has_value() && *input > 0 ? static_cast<std::uint64_t>(*input) : 0;
  usage.output_tokens = output.has_value() && *output > 0 ? static_cast<std::uint64_t>(*output) : 0;
  return usage;
}

} // namespace

common::Result<ConversationRecord> parse_record_jsonl(const std::string &line) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty()) {
    return common::Result<ConversationRecord>::failure("empty record line");
  }
  if (common::json_value_end(trimmed, 0) != trimmed.size() ||
      !common::json_object_members(trimmed).has_value()) {
    return common::Result<ConversationRecord>::failure("malformed record line");
  }

  ConversationRecord record;
  const std::string message = common::json_get_object(trimmed, "message");
  std::string type = common::json_get_string(trimmed, "type");
  if (type.empty() && !message.empty()) {
    type = common::json_get_string(message, "role");
  }
  record.role = role_from_string(type);
  record.timestamp = common::json_get_string(trimmed, "timestamp");

  if (!message.empty()) {
    record.content = parse_content(common::json_get_raw(message, "content"));
    record.usage = parse_usage(common::json_get_object(message, "usage"));
    if (std::string model = common::json_get_string(message, "model"); !model.empty()) {
      record.model = std::move(model);
    }
  }

  return common::Result<ConversationRecord>::success(std::move(record));
}

std::vector<ConversationRecord> parse_conversation_text(const std::string &content) {
  std::vector<ConversationRecord> records;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    auto parsed = parse_record_jsonl(line);
    if (!parsed.ok()) {
      continue;
    }
    records.push_back(std::move(parsed.value()));
  }
  return records;
}

common::Result<Conversation> load_conversation_file(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Conversation>::failure(content.error());
  }
  Conversation conversation;
  conversation.file_path = path.string();
  conversation.records = parse_conversation_text(content.value());
  return common::Result<Conversation>::success(std::move(conversation));
}

} // namespace traceops::transcript
