#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace traceops::common {

using JsonMembers = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (including \uXXXX to UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// One past the last character of the value starting at pos, or npos when malformed.
[[nodiscard]] std::size_t json_value_end(const std::string &json, std::size_t pos);

[[nodiscard]] std::optional<JsonMembers> json_object_members(const std::string &object_json);

[[nodiscard]] std::optional<std::vector<std::string>>
json_array_elements(const std::string &array_json);

[[nodiscard]] std::string json_get_raw(const std::string &json, const std::string &field);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

[[nodiscard]] std::optional<std::int64_t> json_get_int(const std::string &json,
                                                       const std::string &field);

[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

[[nodiscard]] bool json_is_string(const std::string &raw);
[[nodiscard]] bool json_is_object(const std::string &raw);

[[nodiscard]] std::optional<std::string> json_string_value(const std::string &raw);

/// Parse a raw JSON number as an integer (fractional part truncated). nullopt
/// when the value does not fit in int64.
[[nodiscard]] std::optional<std::int64_t> json_int_value(const std::string &raw);

[[nodiscard]] std::string json_minify(const std::string &raw);

} // namespace traceops::common
