#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "agripv/core/pricing.h"

#define AGRIPV_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

agripv::TierPricing three_tiers() {
  agripv::TierPricing t;
  t.brackets.push_back({0.0, 10.0, 0.5});
  t.brackets.push_back({10.0, 20.0, 1.0});
  t.brackets.push_back({20.0, std::numeric_limits<double>::infinity(), 2.0});
  return t;
}

} // namespace

int test_pricing() {
  using agripv::tiered_charge;
  using agripv::marginal_tier_price;

  const agripv::TierPricing tiers = three_tiers();

  // Spans the first two brackets.
  {
    const auto c = tiered_charge(15.0, 0.0, tiers);
    AGRIPV_ASSERT(near(c.total_cost, 10.0));
    AGRIPV_ASSERT(c.marginal_tier == 2);
    AGRIPV_ASSERT(near(c.cost_per_unit, 10.0 / 15.0));
  }

  // Month already 18 m3 in: 2 units at tier 2, then 3 at tier 3.
  {
    const auto c = tiered_charge(5.0, 18.0, tiers);
    AGRIPV_ASSERT(near(c.total_cost, 8.0));
    AGRIPV_ASSERT(c.marginal_tier == 3);
  }

  // Nothing bought.
  {
    const auto c = tiered_charge(0.0, 5.0, tiers);
    AGRIPV_ASSERT(c.total_cost == 0.0);
    AGRIPV_ASSERT(c.marginal_tier == 0);
  }

  // Wastewater surcharge on top.
  {
    agripv::TierPricing t = tiers;
    t.include_wastewater_surcharge = true;
    t.wastewater_surcharge_pct = 75.0;
    AGRIPV_ASSERT(near(tiered_charge(15.0, 0.0, t).total_cost, 17.5));
    AGRIPV_ASSERT(near(marginal_tier_price(0.0, t), 0.875));
  }

  // Beyond a closed final bracket the last rate applies.
  {
    agripv::TierPricing t;
    t.brackets.push_back({0.0, 10.0, 0.5});
    const auto c = tiered_charge(15.0, 0.0, t);
    AGRIPV_ASSERT(near(c.total_cost, 7.5));
    AGRIPV_ASSERT(c.marginal_tier == 1);
    AGRIPV_ASSERT(near(marginal_tier_price(50.0, t), 0.5));
  }

  AGRIPV_ASSERT(near(marginal_tier_price(0.0, tiers), 0.5));
  AGRIPV_ASSERT(near(marginal_tier_price(10.0, tiers), 1.0));
  AGRIPV_ASSERT(near(marginal_tier_price(25.0, tiers), 2.0));

  bool threw = false;
  try {
    (void)tiered_charge(1.0, 0.0, agripv::TierPricing{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  AGRIPV_ASSERT(threw);

  return 0;
}
