#pragma once

#include "traceops/config/schema.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace traceops::timeline {

struct CostBreakdown {
  double input = 0.0;
  double output = 0.0;
  [[nodiscard]] double total() const { return input + output; }
};

/// Maps (input tokens, output tokens, model) to an approximate dollar cost.
/// Tiers match by case-insensitive substring; anything unmatched, empty or
/// "unknown" prices at the standard tier. Never fails.
class CostEstimator {
public:
  CostEstimator() = default;
  explicit CostEstimator(config::PricingConfig pricing) : pricing_(std::move(pricing)) {}

  [[nodiscard]] const config::PricingTier &tier_for(const std::string &model) const;
  [[nodiscard]] CostBreakdown breakdown(std::uint64_t input_tokens, std::uint64_t output_tokens,
                                        const std::string &model) const;
  [[nodiscard]] double estimate(std::uint64_t input_tokens, std::uint64_t output_tokens,
                                const std::string &model) const;

private:
  config::PricingConfig pricing_;
};

[[nodiscard]] std::string format_cost(double dollars);

} // namespace traceops::timeline
