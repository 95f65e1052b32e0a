#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace traceops::timeline {

constexpr std::int64_t kDefaultMaxElapsedMs = 3'600'000;

/// "42s", "3m5s" or "3m". nullopt for negative spans, spans under one second
/// and spans above max_ms.
[[nodiscard]] std::optional<std::string> format_elapsed(std::int64_t diff_ms,
                                                        std::int64_t max_ms = kDefaultMaxElapsedMs);

[[nodiscard]] std::optional<std::string> elapsed_between(std::optional<std::int64_t> from_ms,
                                                         std::optional<std::int64_t> to_ms,
                                                         std::int64_t max_ms = kDefaultMaxElapsedMs);

} // namespace traceops::timeline
