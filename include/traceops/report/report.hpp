#pragma once

#include "traceops/timeline/compiler.hpp"
#include "traceops/timeline/cost.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace traceops::report {

struct UsageSummary {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  std::vector<std::string> models;
  std::string tier;
  timeline::CostBreakdown cost;
};

/// Totals over every assistant record. Cost is priced at the tier of the
/// first model seen.
[[nodiscard]] UsageSummary aggregate_usage(const std::vector<timeline::CompiledTimeline> &timelines,
                                           const timeline::CostEstimator &costs);

[[nodiscard]] std::vector<std::pair<std::string, std::size_t>>
tool_usage_distribution(const std::vector<timeline::CompiledTimeline> &timelines);

[[nodiscard]] std::string format_session_duration(std::int64_t diff_ms);

[[nodiscard]] std::string generate_report(const std::vector<timeline::CompiledTimeline> &timelines,
                                          const timeline::CostEstimator &costs);

} // namespace traceops::report
