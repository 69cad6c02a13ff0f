#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

#include "agripv/core/water_policy.h"

#define AGRIPV_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

// 3 kWh/m3 at $0.10/kWh plus $0.05 O&M: groundwater costs $0.35/m3.
agripv::WaterPolicyContext base_context() {
  agripv::WaterPolicyContext ctx;
  ctx.demand_m3 = 100.0;
  ctx.energy_price_usd_per_kwh = 0.10;
  ctx.municipal_price_usd_per_m3 = 0.75;
  ctx.pumping_kwh_per_m3 = 1.0;
  ctx.conveyance_kwh_per_m3 = 0.2;
  ctx.treatment_kwh_per_m3 = 1.8;
  ctx.gw_maintenance_usd_per_m3 = 0.05;
  return ctx;
}

bool balanced(const agripv::WaterAllocation& a, double demand) {
  return near(a.groundwater_m3 + a.municipal_m3, demand) && a.groundwater_m3 >= 0.0 && a.municipal_m3 >= 0.0;
}

} // namespace

int test_water_policy() {
  using namespace agripv;

  AGRIPV_ASSERT(near(groundwater_kwh_per_m3(base_context()), 3.0));
  AGRIPV_ASSERT(near(groundwater_cost_per_m3(base_context()), 0.35));

  // Cheapest source picks groundwater when it is cheaper.
  {
    CheapestSourcePolicy p(true);
    const auto a = p.allocate(base_context());
    AGRIPV_ASSERT(balanced(a, 100.0));
    AGRIPV_ASSERT(near(a.groundwater_m3, 100.0));
    AGRIPV_ASSERT(near(a.energy_used_kwh, 300.0));
    AGRIPV_ASSERT(near(a.cost_usd, 35.0));
    AGRIPV_ASSERT(a.reason_label() == "gw_cheaper");
  }

  // ...and municipal when it is not.
  {
    auto ctx = base_context();
    ctx.municipal_price_usd_per_m3 = 0.30;
    CheapestSourcePolicy p(true);
    const auto a = p.allocate(ctx);
    AGRIPV_ASSERT(near(a.municipal_m3, 100.0));
    AGRIPV_ASSERT(a.energy_used_kwh == 0.0);
    AGRIPV_ASSERT(near(a.cost_usd, 30.0));
    AGRIPV_ASSERT(a.reason_label() == "muni_cheaper");
  }

  // Without energy in the comparison, groundwater wins on O&M alone but is still
  // charged its full energy-inclusive cost.
  {
    auto ctx = base_context();
    ctx.municipal_price_usd_per_m3 = 0.30;
    CheapestSourcePolicy p(false);
    const auto a = p.allocate(ctx);
    AGRIPV_ASSERT(near(a.groundwater_m3, 100.0));
    AGRIPV_ASSERT(near(a.cost_usd, 35.0));
  }

  // Energy bound: 150 kWh covers 50 m3.
  {
    auto ctx = base_context();
    ctx.available_energy_kwh = 150.0;
    const auto a = CheapestSourcePolicy(true).allocate(ctx);
    AGRIPV_ASSERT(balanced(a, 100.0));
    AGRIPV_ASSERT(near(a.groundwater_m3, 50.0));
    AGRIPV_ASSERT(a.constraint == BindingConstraint::Energy);
    AGRIPV_ASSERT(a.reason_label() == "gw_cheaper_but_energy_limit");
    AGRIPV_ASSERT(near(a.cost_usd, 50.0 * 0.35 + 50.0 * 0.75));
  }

  // Tightest of several bounds wins.
  {
    auto ctx = base_context();
    ctx.available_energy_kwh = 150.0;
    ctx.max_groundwater_m3 = 40.0;
    ctx.max_treatment_m3 = 60.0;
    const auto a = AlwaysGroundwaterPolicy().allocate(ctx);
    AGRIPV_ASSERT(near(a.groundwater_m3, 40.0));
    AGRIPV_ASSERT(a.reason_label() == "gw_preferred_but_well_limit");
  }

  // A bound equal to the request does not bind.
  {
    auto ctx = base_context();
    ctx.max_groundwater_m3 = 100.0;
    const auto a = AlwaysGroundwaterPolicy().allocate(ctx);
    AGRIPV_ASSERT(near(a.groundwater_m3, 100.0));
    AGRIPV_ASSERT(a.constraint == BindingConstraint::None);
    AGRIPV_ASSERT(a.reason_label() == "gw_preferred");
  }

  // Treatment bound reported by name.
  {
    auto ctx = base_context();
    ctx.max_treatment_m3 = 30.0;
    const auto a = AlwaysGroundwaterPolicy().allocate(ctx);
    AGRIPV_ASSERT(near(a.groundwater_m3, 30.0));
    AGRIPV_ASSERT(a.reason_label() == "gw_preferred_but_treatment_limit");
  }

  // Zero energy per m3 never limits on energy.
  {
    auto ctx = base_context();
    ctx.pumping_kwh_per_m3 = 0.0;
    ctx.conveyance_kwh_per_m3 = 0.0;
    ctx.treatment_kwh_per_m3 = 0.0;
    ctx.available_energy_kwh = 0.0;
    const auto a = AlwaysGroundwaterPolicy().allocate(ctx);
    AGRIPV_ASSERT(near(a.groundwater_m3, 100.0));
    AGRIPV_ASSERT(a.energy_used_kwh == 0.0);
  }

  // Always municipal: no groundwater, no energy.
  {
    const auto a = AlwaysMunicipalPolicy().allocate(base_context());
    AGRIPV_ASSERT(a.groundwater_m3 == 0.0);
    AGRIPV_ASSERT(a.energy_used_kwh == 0.0);
    AGRIPV_ASSERT(near(a.municipal_m3, 100.0));
    AGRIPV_ASSERT(a.reason_label() == "muni_only");
  }

  // Conserve groundwater: 0.75 > 1.5 x 0.35, so up to 30% groundwater.
  {
    ConserveGroundwaterPolicy p(1.5, 0.30);
    const auto a = p.allocate(base_context());
    AGRIPV_ASSERT(balanced(a, 100.0));
    AGRIPV_ASSERT(near(a.groundwater_m3, 30.0));
    AGRIPV_ASSERT(a.limiting_factor == "ratio_cap");
    AGRIPV_ASSERT(a.reason_label() == "threshold_exceeded");

    auto ctx = base_context();
    ctx.municipal_price_usd_per_m3 = 0.50;
    const auto b = p.allocate(ctx);
    AGRIPV_ASSERT(b.groundwater_m3 == 0.0);
    AGRIPV_ASSERT(b.reason_label() == "threshold_not_met");

    ctx = base_context();
    ctx.max_groundwater_m3 = 10.0;
    const auto c = p.allocate(ctx);
    AGRIPV_ASSERT(near(c.groundwater_m3, 10.0));
    AGRIPV_ASSERT(c.limiting_factor == "well_limit");
  }

  // Factory.
  {
    auto p = make_water_policy("Cheapest_Source", WaterPolicyParams{});
    AGRIPV_ASSERT(p->kind() == WaterPolicyKind::CheapestSource);
    AGRIPV_ASSERT(std::string(p->id()) == "cheapest_source");
    AGRIPV_ASSERT(!p->describe().empty());

    bool threw = false;
    try {
      (void)make_water_policy("desalinate_everything", WaterPolicyParams{});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    AGRIPV_ASSERT(threw);

    threw = false;
    try {
      WaterPolicyParams params;
      params.max_gw_ratio = 1.5;
      (void)make_water_policy("conserve_groundwater", params);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    AGRIPV_ASSERT(threw);
  }

  return 0;
}
