#include "traceops/timeline/elapsed.hpp"

#include <cmath>

namespace traceops::timeline {

std::optional<std::string> format_elapsed(const std::int64_t diff_ms, const std::int64_t max_ms) {
  if (diff_ms < 0 || diff_ms > max_ms) {
    return std::nullopt;
  }
  if (diff_ms < 1000) {
    return std::nullopt;
  }
  if (diff_ms < 60'000) {
    return std::to_string(std::llround(static_cast<double>(diff_ms) / 1000.0)) + "s";
  }

  const std::int64_t minutes = diff_ms / 60'000;
  const std::int64_t seconds = std::llround(static_cast<double>(diff_ms % 60'000) / 1000.0);
  if (seconds > 0) {
    return std::to_string(minutes) + "m" + std::to_string(seconds) + "s";
  }
  return std::to_string(minutes) + "m";
}

std::optional<std::string> elapsed_between(const std::optional<std::int64_t> from_ms,
                                           const std::optional<std::int64_t> to_ms,
                                           const std::int64_t max_ms) {
  if (!from_ms.has_value() || !to_ms.has_value()) {
    return std::nullopt;
  }
  return format_elapsed(*to_ms - *from_ms, max_ms);
}

} // namespace traceops::timeline
