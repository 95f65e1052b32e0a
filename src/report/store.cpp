#include "traceops/report/store.hpp"

#include "traceops/common/fs.hpp"
#include "traceops/common/time.hpp"
#include "traceops/report/discovery.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>

namespace traceops::report {

namespace {

constexpr const char *kReportPrefix = "report-";
constexpr const char *kReportSuffix = ".md";

std::string one_decimal(const double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.1f", value);
  return buffer;
}

} // namespace

ReportStore::ReportStore(std::filesystem::path output_dir)
    : output_dir_(std::filesystem::path(common::expand_path(output_dir.string()))) {}

std::filesystem::path ReportStore::project_dir(const std::string &project_path) const {
  return output_dir_ / map_project_name(resolve_project_path(project_path));
}

common::Result<std::filesystem::path> ReportStore::write(const std::string &project_path,
                                                         const std::string &report,
                                                         const std::int64_t now_ms) const {
  const auto dir = common::ensure_dir(project_dir(project_path));
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }

  const auto path = dir.value() / (std::string(kReportPrefix) + common::utc_file_stamp(now_ms) +
                                   kReportSuffix);
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return common::Result<std::filesystem::path>::failure("failed to open report: " +
                                                          path.string());
  }
  out << report;
  out.flush();
  if (!out) {
    return common::Result<std::filesystem::path>::failure("failed to write report: " +
                                                          path.string());
  }
  return common::Result<std::filesystem::path>::success(path);
}

common::Result<std::vector<ReportInfo>> ReportStore::list(const std::string &project_path) const {
  const auto dir = project_dir(project_path);
  std::vector<ReportInfo> reports;
  if (!std::filesystem::exists(dir)) {
    return common::Result<std::vector<ReportInfo>>::success(std::move(reports));
  }

  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; it != end && !ec; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (!common::starts_with(name, kReportPrefix) || !common::ends_with(name, kReportSuffix)) {
      continue;
    }
    std::error_code size_ec;
    const auto size = std::filesystem::file_size(it->path(), size_ec);
    reports.push_back(ReportInfo{.path = it->path(),
                                 .filename = name,
                                 .modified_ms = file_modified_ms(it->path()),
                                 .size_bytes = size_ec ? 0 : size});
  }
  if (ec) {
    return common::Result<std::vector<ReportInfo>>::failure("failed to list reports in " +
                                                            dir.string() + ": " + ec.message());
  }

  std::sort(reports.begin(), reports.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.modified_ms != rhs.modified_ms) {
      return lhs.modified_ms > rhs.modified_ms;
    }
    return lhs.filename > rhs.filename;
  });
  return common::Result<std::vector<ReportInfo>>::success(std::move(reports));
}

std::string format_time_ago(const std::int64_t diff_ms) {
  const std::int64_t seconds = std::max<std::int64_t>(0, diff_ms) / 1000;
  const std::int64_t minutes = seconds / 60;
  const std::int64_t hours = minutes / 60;
  const std::int64_t days = hours / 24;

  if (seconds < 60) {
    return std::to_string(seconds) + "s ago";
  }
  if (minutes < 60) {
    return std::to_string(minutes) + "m ago";
  }
  if (hours < 24) {
    return std::to_string(hours) + "h ago";
  }
  if (days < 30) {
    return std::to_string(days) + "d ago";
  }
  if (days / 30 < 12) {
    return std::to_string(days / 30) + "mo ago";
  }
  return std::to_string(days / 365) + "y ago";
}

std::string format_bytes(const std::uintmax_t bytes) {
  if (bytes < 1024) {
    return std::to_string(bytes) + "B";
  }
  if (bytes < 1024 * 1024) {
    return one_decimal(static_cast<double>(bytes) / 1024.0) + "KB";
  }
  return one_decimal(static_cast<double>(bytes) / (1024.0 * 1024.0)) + "MB";
}

} // namespace traceops::report
