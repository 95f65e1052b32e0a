#include "traceops/report/discovery.hpp"

#include "traceops/common/fs.hpp"

#include <algorithm>
#include <chrono>

namespace traceops::report {

namespace {

bool has_conversation_logs(const std::filesystem::path &dir) {
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; it != end && !ec; it.increment(ec)) {
    if (it->path().extension() == ".jsonl") {
      return true;
    }
  }
  return false;
}

} // namespace

std::string map_project_name(const std::filesystem::path &resolved_path) {
  std::string mapped = resolved_path.string();
  std::replace(mapped.begin(), mapped.end(), '/', '-');
  return mapped;
}

std::filesystem::path resolve_project_path(const std::string &project_path) {
  const std::string expanded = common::expand_path(project_path.empty() ? "." : project_path);
  std::error_code ec;
  auto absolute = std::filesystem::absolute(expanded, ec);
  if (ec) {
    return std::filesystem::path(expanded).lexically_normal();
  }
  auto normalized = absolute.lexically_normal();
  if (normalized.has_filename() || normalized == normalized.root_path()) {
    return normalized;
  }
  return normalized.parent_path();
}

common::Result<std::vector<std::filesystem::path>>
resolve_project_dirs(const std::string &project_path, const std::string &projects_root) {
  const auto resolved = resolve_project_path(project_path);
  if (!std::filesystem::exists(resolved)) {
    return common::Result<std::vector<std::filesystem::path>>::failure(
        "Project path not found: " + resolved.string());
  }

  if (std::filesystem::is_directory(resolved) && has_conversation_logs(resolved)) {
    return common::Result<std::vector<std::filesystem::path>>::success({resolved});
  }

  const std::filesystem::path mapped =
      std::filesystem::path(common::expand_path(projects_root)) / map_project_name(resolved);
  if (!std::filesystem::is_directory(mapped)) {
    return common::Result<std::vector<std::filesystem::path>>::failure(
        "No conversation history found for project: " + resolved.string() +
        "\nExpected: " + mapped.string());
  }
  return common::Result<std::vector<std::filesystem::path>>::success({mapped});
}

std::int64_t file_modified_ms(const std::filesystem::path &path) {
  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return 0;
  }
  const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      mtime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
  return std::chrono::duration_cast<std::chrono::milliseconds>(system_time.time_since_epoch())
      .count();
}

std::vector<ConversationFile> find_conversation_files(const std::filesystem::path &dir) {
  std::vector<ConversationFile> files;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; it != end && !ec; it.increment(ec)) {
    if (!it->is_regular_file(ec) || it->path().extension() != ".jsonl") {
      continue;
    }
    files.push_back(ConversationFile{.path = it->path(), .modified_ms = file_modified_ms(it->path())});
  }

  std::stable_sort(files.begin(), files.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.modified_ms != rhs.modified_ms) {
      return lhs.modified_ms > rhs.modified_ms;
    }
    return lhs.path < rhs.path;
  });
  return files;
}

std::vector<std::filesystem::path>
collect_conversation_files(const std::vector<std::filesystem::path> &dirs,
                           const std::optional<std::size_t> recent) {
  std::vector<ConversationFile> all;
  for (const auto &dir : dirs) {
    auto files = find_conversation_files(dir);
    all.insert(all.end(), std::make_move_iterator(files.begin()),
               std::make_move_iterator(files.end()));
  }
  std::stable_sort(all.begin(), all.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.modified_ms > rhs.modified_ms;
  });

  const std::size_t keep = recent.has_value() ? std::min(*recent, all.size()) : all.size();
  std::vector<std::filesystem::path> out;
  out.reserve(keep);
  for (std::size_t i = 0; i < keep; ++i) {
    out.push_back(std::move(all[i].path));
  }
  return out;
}

} // namespace traceops::report
