#pragma once

#include "traceops/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace traceops::report {

[[nodiscard]] std::string map_project_name(const std::filesystem::path &resolved_path);

[[nodiscard]] std::filesystem::path resolve_project_path(const std::string &project_path);

/// A directory that already holds .jsonl logs is used as-is; otherwise the
/// project path is mapped under projects_root, which must exist.
[[nodiscard]] common::Result<std::vector<std::filesystem::path>>
resolve_project_dirs(const std::string &project_path, const std::string &projects_root);

struct ConversationFile {
  std::filesystem::path path;
  std::int64_t modified_ms = 0;
};

[[nodiscard]] std::vector<ConversationFile>
find_conversation_files(const std::filesystem::path &dir);

[[nodiscard]] std::vector<std::filesystem::path>
collect_conversation_files(const std::vector<std::filesystem::path> &dirs,
                           std::optional<std::size_t> recent = std::nullopt);

[[nodiscard]] std::int64_t file_modified_ms(const std::filesystem::path &path);

} // namespace traceops::report
