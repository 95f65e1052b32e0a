#include "traceops/timeline/formatters.hpp"

#include "traceops/common/fs.hpp"
#include "traceops/common/json_util.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <utility>

namespace traceops::timeline {

namespace {

constexpr std::size_t kQuestionMaxChars = 60;
constexpr std::size_t kUrlMaxChars = 50;
constexpr std::size_t kQueryMaxChars = 50;
constexpr std::string_view kExternalPrefix = "mcp__";
constexpr std::int64_t kMaxLineNumber = 1'000'000'000;

constexpr std::array<std::pair<std::string_view, ToolKind>, 8> kToolTable = {{
    {"Read", ToolKind::Read},
    {"Write", ToolKind::Write},
    {"Edit", ToolKind::Edit},
    {"Bash", ToolKind::Bash},
    {"Task", ToolKind::Task},
    {"AskUserQuestion", ToolKind::AskUserQuestion},
    {"WebFetch", ToolKind::WebFetch},
    {"WebSearch", ToolKind::WebSearch},
}};

std::string size_label(const std::string &key, const std::size_t bytes) {
  return key + "=" + std::to_string(bytes) + "b";
}

std::int64_t clamp_line_count(const std::int64_t value) {
  return std::clamp<std::int64_t>(value, 0, kMaxLineNumber);
}

std::size_t result_bytes(const transcript::ToolResultBlock *result) {
  return result == nullptr ? 0 : result->content.byte_size();
}

std::string external_display_name(const std::string &name) {
  std::string stripped = common::starts_with(name, std::string(kExternalPrefix))
                             ? name.substr(kExternalPrefix.size())
                             : name;
  std::string out;
  out.reserve(stripped.size());
  for (std::size_t i = 0; i < stripped.size(); ++i) {
    if (stripped[i] == '_' && i + 1 < stripped.size() && stripped[i + 1] == '_') {
      out.push_back('.');
      ++i;
      continue;
    }
    out.push_back(stripped[i]);
  }
  return out;
}

std::string format_bash(const transcript::ToolUseBlock &tool,
                        const transcript::ToolResultBlock *result,
                        const ActionMetadata &metadata) {
  const std::string command = tool.input_string("command").value_or("");
  const std::int64_t exit_code =
      result != nullptr && result->exit_code.has_value() ? *result->exit_code : 0;

  auto parts = metadata.parts();
  if (exit_code != 0) {
    parts.push_back("exit=" + std::to_string(exit_code));
  }
  if (!command.empty()) {
    parts.push_back(size_label("cmd", command.size()));
  }
  if (result != nullptr && !result->content.empty()) {
    parts.push_back(size_label("out", result->content.byte_size()));
  }

  if (contains_heredoc(command)) {
    return "Bash: " + bracket(parts) + "<heredoc - see tool_use_id=\"" + tool.id + "\">";
  }
  return "Bash: " + bracket(parts) + command;
}

std::string format_task(const transcript::ToolUseBlock &tool, const ActionMetadata &metadata) {
  const std::string subagent = tool.input_string("subagent_type").value_or("unknown");
  const std::string description = tool.input_string("description").value_or("");
  std::string line = "Task: " + bracket(metadata.parts()) + subagent;
  if (!description.empty()) {
    line += " (\"" + description + "\")";
  }
  return line;
}

std::string format_ask_user(const transcript::ToolUseBlock &tool, const ActionMetadata &metadata) {
  std::string question;
  if (const auto raw = tool.input_raw("questions"); raw.has_value()) {
    const auto questions = common::json_array_elements(*raw);
    if (questions.has_value() && !questions->empty()) {
      question = common::json_get_string(questions->front(), "question");
    }
  }
  if (question.empty()) {
    question = "User question";
  }
  return bracket(metadata.parts()) + "Asked: \"" +
         common::truncate_ellipsis(question, kQuestionMaxChars) + "\"";
}

std::string format_web_fetch(const transcript::ToolUseBlock &tool,
                             const transcript::ToolResultBlock *result,
                             const ActionMetadata &metadata) {
  const std::string url = tool.input_string("url").value_or("unknown");
  const std::size_t in_bytes = tool.input_string("prompt").value_or("").size();
  const std::size_t out_bytes = result_bytes(result);

  auto parts = metadata.parts();
  if (in_bytes > 0) {
    parts.push_back(size_label("in", in_bytes));
  }
  if (out_bytes > 0) {
    parts.push_back(size_label("out", out_bytes));
  }
  return bracket(parts) + "WebFetch: " + common::truncate_ellipsis(url, kUrlMaxChars);
}

std::string format_web_search(const transcript::ToolUseBlock &tool,
                              const transcript::ToolResultBlock *result,
                              const ActionMetadata &metadata) {
  const std::string query = tool.input_string("query").value_or("unknown");
  const std::size_t out_bytes = result_bytes(result);

  auto parts = metadata.parts();
  if (out_bytes > 0) {
    parts.push_back(size_label("out", out_bytes));
  }
  return bracket(parts) + "WebSearch: \"" + common::truncate_ellipsis(query, kQueryMaxChars) +
         "\"";
}

std::vector<std::string> io_size_parts(const transcript::ToolUseBlock &tool,
                                       const transcript::ToolResultBlock *result,
                                       const ActionMetadata &metadata) {
  auto parts = metadata.parts();
  const std::size_t in_bytes = tool.input_json().size();
  const std::size_t out_bytes = result_bytes(result);
  if (in_bytes > 0) {
    parts.push_back(size_label("in", in_bytes));
  }
  if (out_bytes > 0) {
    parts.push_back(size_label("out", out_bytes));
  }
  return parts;
}

std::string format_external(const transcript::ToolUseBlock &tool,
                            const transcript::ToolResultBlock *result,
                            const ActionMetadata &metadata) {
  std::string params;
  for (const auto &[key, raw] : tool.input) {
    if (!params.empty()) {
      params += ", ";
    }
    if (auto text = common::json_string_value(raw); text.has_value()) {
      params += key + "=" + *text;
    } else {
      params += key + "=" + common::json_minify(raw);
    }
  }
  return "MCP: " + bracket(io_size_parts(tool, result, metadata)) +
         external_display_name(tool.name) + "(" + params + ")";
}

std::string format_unrecognized(const transcript::ToolUseBlock &tool,
                                const transcript::ToolResultBlock *result,
                                const ActionMetadata &metadata) {
  const std::string name = common::starts_with(tool.name, std::string(kExternalPrefix))
                               ? tool.name.substr(kExternalPrefix.size())
                               : tool.name;
  return bracket(io_size_parts(tool, result, metadata)) + name +
         ": (new tool - needs formatter)";
}

} // namespace

ToolKind classify_tool(std::string_view name) {
  if (is_external_tool(name)) {
    return ToolKind::External;
  }
  for (const auto &[tool_name, kind] : kToolTable) {
    if (tool_name == name) {
      return kind;
    }
  }
  return ToolKind::Unrecognized;
}

std::string_view tool_kind_label(const ToolKind kind) {
  switch (kind) {
  case ToolKind::Read:
    return "Read";
  case ToolKind::Write:
    return "Write";
  case ToolKind::Edit:
    return "Edit";
  case ToolKind::Bash:
    return "Bash";
  case ToolKind::Task:
    return "Task";
  case ToolKind::AskUserQuestion:
    return "AskUserQuestion";
  case ToolKind::WebFetch:
    return "WebFetch";
  case ToolKind::WebSearch:
    return "WebSearch";
  case ToolKind::External:
    return "MCP";
  case ToolKind::Unrecognized:
    return "Unrecognized";
  }
  return "Unrecognized";
}

bool is_file_operation(const ToolKind kind) {
  return kind == ToolKind::Read || kind == ToolKind::Write || kind == ToolKind::Edit;
}

bool is_external_tool(std::string_view name) {
  return name.substr(0, kExternalPrefix.size()) == kExternalPrefix;
}

std::vector<std::string> ActionMetadata::parts() const {
  std::vector<std::string> out;
  if (elapsed.has_value()) {
    out.push_back("+" + *elapsed);
  }
  if (usage.has_value()) {
    out.push_back(*usage);
  }
  return out;
}

std::string bracket(const std::vector<std::string> &parts) {
  if (parts.empty()) {
    return "";
  }
  std::string out = "[";
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out += parts[i];
  }
  out += "] ";
  return out;
}

bool contains_heredoc(const std::string &command) {
  static const std::regex heredoc_pattern(R"(<<\s*['"]?\w+['"]?)");
  return std::regex_search(command, heredoc_pattern);
}

FileOperation describe_file_operation(const ToolKind kind, const transcript::ToolUseBlock &tool,
                                      const transcript::ToolResultBlock *result) {
  FileOperation op;
  op.filename = common::path_basename(tool.input_string("file_path").value_or("unknown"));

  if (kind == ToolKind::Read) {
    std::size_t lines = 1;
    if (result != nullptr) {
      op.bytes = result->content.byte_size();
      if (result->content.is_text()) {
        lines = common::count_lines(*result->content.text);
      }
    }
    const std::int64_t offset = clamp_line_count(tool.input_int("offset").value_or(0));
    const std::int64_t limit = clamp_line_count(tool.input_int("limit").value_or(0));
    const std::int64_t end =
        limit != 0 ? offset + limit
                   : offset + clamp_line_count(static_cast<std::int64_t>(lines));
    op.line_range = "L" + std::to_string(offset + 1) + "-L" + std::to_string(end);
    return op;
  }

  // Write spans the whole new file. Edit only knows the replacement text, so
  // its range starts at line 1 rather than the edited location.
  const std::string body =
      tool.input_string(kind == ToolKind::Write ? "content" : "new_string").value_or("");
  op.bytes = body.size();
  op.line_range = "L1-L" + std::to_string(common::count_lines(body));
  return op;
}

std::string format_action(const ToolKind kind, const transcript::ToolUseBlock &tool,
                          const transcript::ToolResultBlock *result,
                          const ActionMetadata &metadata) {
  switch (kind) {
  case ToolKind::Bash:
    return format_bash(tool, result, metadata);
  case ToolKind::Task:
    return format_task(tool, metadata);
  case ToolKind::AskUserQuestion:
    return format_ask_user(tool, metadata);
  case ToolKind::WebFetch:
    return format_web_fetch(tool, result, metadata);
  case ToolKind::WebSearch:
    return format_web_search(tool, result, metadata);
  case ToolKind::External:
    return format_external(tool, result, metadata);
  case ToolKind::Read:
  case ToolKind::Write:
  case ToolKind::Edit:
  case ToolKind::Unrecognized:
    break;
  }
  return format_unrecognized(tool, result, metadata);
}

} // namespace traceops::timeline
