#include "agripv/core/pricing.h"

#include <algorithm>
#include <stdexcept>

namespace agripv {
namespace {

double surcharge_multiplier(const TierPricing& tiers) {
  return tiers.include_wastewater_surcharge ? 1.0 + tiers.wastewater_surcharge_pct / 100.0 : 1.0;
}

} // namespace

TieredCharge tiered_charge(double units, double already_used, const TierPricing& tiers) {
  if (tiers.brackets.empty()) throw std::invalid_argument("tiered pricing has no brackets");

  TieredCharge out;
  if (units <= 0.0) return out;

  double position = std::max(0.0, already_used);
  double remaining = units;
  for (std::size_t i = 0; i < tiers.brackets.size() && remaining > 0.0; ++i) {
    const TierBracket& b = tiers.brackets[i];
    if (position >= b.max_units) continue;
    const double from = std::max(position, b.min_units);
    const double to = std::min(position + remaining, b.max_units);
    const double in_tier = std::max(0.0, to - from);
    if (in_tier <= 0.0) continue;
    out.total_cost += in_tier * b.price_per_unit;
    out.marginal_tier = static_cast<int>(i) + 1;
    remaining -= in_tier;
    position += in_tier;
  }
  // Anything beyond a closed final bracket pays the last rate.
  if (remaining > 0.0) {
    out.total_cost += remaining * tiers.brackets.back().price_per_unit;
    out.marginal_tier = static_cast<int>(tiers.brackets.size());
  }

  out.total_cost *= surcharge_multiplier(tiers);
  out.cost_per_unit = out.total_cost / units;
  return out;
}

double marginal_tier_price(double already_used, const TierPricing& tiers) {
  if (tiers.brackets.empty()) throw std::invalid_argument("tiered pricing has no brackets");
  double price = tiers.brackets.back().price_per_unit;
  for (const TierBracket& b : tiers.brackets) {
    if (already_used < b.max_units) {
      price = b.price_per_unit;
      break;
    }
  }
  return price * surcharge_multiplier(tiers);
}

} // namespace agripv
