#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace traceops::common {

/// Milliseconds since the Unix epoch for an ISO-8601 / RFC 3339 timestamp
/// ("2025-03-01T10:15:30.250Z", "2025-03-01T12:15:30+02:00"). nullopt when
/// the text does not parse.
[[nodiscard]] std::optional<std::int64_t> parse_timestamp_ms(const std::string &text);

[[nodiscard]] std::string format_local_datetime(std::int64_t epoch_ms);

[[nodiscard]] std::string utc_file_stamp(std::int64_t epoch_ms);

[[nodiscard]] std::int64_t now_epoch_ms();

} // namespace traceops::common
