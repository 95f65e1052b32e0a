#pragma once

#include "traceops/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace traceops::report {

struct ReportInfo {
  std::filesystem::path path;
  std::string filename;
  std::int64_t modified_ms = 0;
  std::uintmax_t size_bytes = 0;
};

class ReportStore {
public:
  explicit ReportStore(std::filesystem::path output_dir);

  [[nodiscard]] std::filesystem::path project_dir(const std::string &project_path) const;

  [[nodiscard]] common::Result<std::filesystem::path>
  write(const std::string &project_path, const std::string &report, std::int64_t now_ms) const;

  [[nodiscard]] common::Result<std::vector<ReportInfo>> list(const std::string &project_path) const;

  [[nodiscard]] const std::filesystem::path &output_dir() const { return output_dir_; }

private:
  std::filesystem::path output_dir_;
};

[[nodiscard]] std::string format_time_ago(std::int64_t diff_ms);

[[nodiscard]] std::string format_bytes(std::uintmax_t bytes);

} // namespace traceops::report
