#include "traceops/timeline/cost.hpp"

#include "traceops/common/fs.hpp"

#include <iomanip>
#include <sstream>

namespace traceops::timeline {

namespace {

bool tier_matches(const config::PricingTier &tier, const std::string &model_lower) {
  for (const auto &needle : tier.match) {
    const std::string lowered = common::to_lower(needle);
    if (!lowered.empty() && model_lower.find(lowered) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

const config::PricingTier &CostEstimator::tier_for(const std::string &model) const {
  const std::string lowered = common::to_lower(common::trim(model));
  if (lowered.empty() || lowered == "unknown") {
    return pricing_.standard;
  }
  if (tier_matches(pricing_.standard, lowered)) {
    return pricing_.standard;
  }
  if (tier_matches(pricing_.premium, lowered)) {
    return pricing_.premium;
  }
  if (tier_matches(pricing_.low, lowered)) {
    return pricing_.low;
  }
  return pricing_.standard;
}

CostBreakdown CostEstimator::breakdown(const std::uint64_t input_tokens,
                                       const std::uint64_t output_tokens,
                                       const std::string &model) const {
  const auto &tier = tier_for(model);
  return CostBreakdown{
      .input = (static_cast<double>(input_tokens) / 1'000'000.0) * tier.input_per_million,
      .output = (static_cast<double>(output_tokens) / 1'000'000.0) * tier.output_per_million};
}

double CostEstimator::estimate(const std::uint64_t input_tokens, const std::uint64_t output_tokens,
                               const std::string &model) const {
  return breakdown(input_tokens, output_tokens, model).total();
}

std::string format_cost(const double dollars) {
  std::ostringstream out;
  out << "$" << std::fixed << std::setprecision(4) << dollars;
  return out.str();
}

} // namespace traceops::timeline
