#pragma once

#include "traceops/common/result.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace traceops::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

[[nodiscard]] std::string collapse_whitespace(const std::string &input);

[[nodiscard]] std::size_t utf8_length(const std::string &value);

[[nodiscard]] std::string truncate_ellipsis(const std::string &value, std::size_t max_chars);

[[nodiscard]] std::size_t count_lines(const std::string &value);

[[nodiscard]] std::string path_basename(const std::string &path);

} // namespace traceops::common
