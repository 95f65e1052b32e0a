#pragma once

#include "traceops/transcript/record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace traceops::timeline {

enum class ToolKind {
  Read,
  Write,
  Edit,
  Bash,
  Task,
  AskUserQuestion,
  WebFetch,
  WebSearch,
  External,
  Unrecognized,
};

[[nodiscard]] ToolKind classify_tool(std::string_view name);
[[nodiscard]] std::string_view tool_kind_label(ToolKind kind);

[[nodiscard]] bool is_file_operation(ToolKind kind);

[[nodiscard]] bool is_external_tool(std::string_view name);

/// Metadata shared by every rendered action: elapsed time and, for
/// single-invocation records, the record's usage and cost.
struct ActionMetadata {
  std::optional<std::string> elapsed;
  std::optional<std::string> usage;

  [[nodiscard]] std::vector<std::string> parts() const;
};

struct FileOperation {
  std::string filename;
  std::size_t bytes = 0;
  std::string line_range;
};

[[nodiscard]] FileOperation describe_file_operation(ToolKind kind,
                                                    const transcript::ToolUseBlock &tool,
                                                    const transcript::ToolResultBlock *result);

[[nodiscard]] std::string format_action(ToolKind kind, const transcript::ToolUseBlock &tool,
                                        const transcript::ToolResultBlock *result,
                                        const ActionMetadata &metadata);

[[nodiscard]] std::string bracket(const std::vector<std::string> &parts);

[[nodiscard]] bool contains_heredoc(const std::string &command);

} // namespace traceops::timeline
