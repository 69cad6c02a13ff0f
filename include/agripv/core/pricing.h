#pragma once

#include "agripv/core/scenario.h"

namespace agripv {

struct TieredCharge {
  double total_cost{0.0};
  // Average price over this purchase (0 when nothing was bought).
  double cost_per_unit{0.0};
  // 1-based bracket of the last unit bought; 0 when nothing was bought.
  int marginal_tier{0};
};

// Bills `units` on top of `already_used` this period, each unit at the rate of the
// bracket it falls in. The wastewater surcharge (if enabled) is applied on top.
TieredCharge tiered_charge(double units, double already_used, const TierPricing& tiers);

// Price of the next unit after `already_used`, surcharge included. Consumption past
// the last bracket is priced at the last bracket's rate.
double marginal_tier_price(double already_used, const TierPricing& tiers);

} // namespace agripv
