#include "agripv/core/simulation.h"

#include "simulation_internal.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "agripv/core/pricing.h"

namespace agripv {
namespace {
using sim_internal::capacity_share;
using sim_internal::well_capacity_m3_day;
} // namespace

// Prices, pumping energy and today's renewable budget, then community drinking and
// building water. Domestic water is drawn from the aquifer and treated like
// irrigation groundwater, but billed at the domestic tariff. Its energy and the
// household and building load come off the renewable budget before any farm pumps.
void Simulation::tick_domestic(DayContext& day) {
  const DataProvider& data = *data_;
  const PricingConfig& pricing = scenario_.pricing;

  day.energy_price_usd_per_kwh = data.electricity_price_usd_per_kwh(pricing.agricultural_energy, day.date);
  day.municipal_price_usd_per_m3 = data.municipal_water_price_usd_per_m3(pricing.agricultural_water, day.date);

  const double head_m = state_.aquifer.effective_head_m(scenario_.wells.well_depth_m);
  day.pumping_kwh_per_m3 = pumping_energy(scenario_.wells, head_m).total_kwh_per_m3();
  day.groundwater_kwh_per_m3 = day.pumping_kwh_per_m3 + cfg_.conveyance_kwh_per_m3 + treatment_kwh_per_m3_;

  day.renewables =
      renewable_output(state_.energy, data, day.date, scenario_.start_date, cfg_.pv_degradation_rate_per_yr);
  const bool has_renewables = state_.energy.pv_capacity_kw > 0.0 || state_.energy.wind_capacity_kw > 0.0;
  day.available_energy_kwh = has_renewables ? day.renewables.total_kwh() : std::numeric_limits<double>::infinity();

  day.household_water_m3 = data.household_water_m3(day.date);
  day.building_water_m3 = data.building_water_m3(day.date);
  day.household_energy_kwh = data.household_energy_kwh(day.date);
  day.building_energy_kwh = data.building_energy_kwh(day.date);

  const double domestic_m3 = day.domestic_water_m3();
  const double domestic_water_kwh = domestic_m3 * day.groundwater_kwh_per_m3;
  state_.aquifer.record_extraction(domestic_m3);
  day.water_energy_kwh += domestic_water_kwh;

  // Community loads are served first; farms pump with what renewables remain.
  if (std::isfinite(day.available_energy_kwh)) {
    const double community_kwh = domestic_water_kwh + day.household_energy_kwh + day.building_energy_kwh;
    day.available_energy_kwh = std::max(0.0, day.available_energy_kwh - community_kwh);
  }

  const double water_cost = domestic_m3 * data.municipal_water_price_usd_per_m3(pricing.domestic_water, day.date);
  const double energy_cost = (day.household_energy_kwh + day.building_energy_kwh) *
                             data.electricity_price_usd_per_kwh(pricing.domestic_energy, day.date);
  add_operating_cost(state_.economics, water_cost + energy_cost);

  CommunityTotals& c = state_.community;
  c.household_water_m3 += day.household_water_m3;
  c.building_water_m3 += day.building_water_m3;
  c.household_energy_kwh += day.household_energy_kwh;
  c.building_energy_kwh += day.building_energy_kwh;
  c.domestic_water_cost_usd += water_cost;
  c.domestic_energy_cost_usd += energy_cost;
}

void Simulation::tick_farms(DayContext& day) {
  const std::optional<TierPricing>& tiers = scenario_.pricing.agricultural_water_tiers;
  std::vector<double> per_planting;

  for (std::size_t fi = 0; fi < state_.farms.size(); ++fi) {
    FarmState& farm = state_.farms[fi];
    const double demand = farm_irrigation_demand(farm, day.date, *data_, per_planting);
    if (demand <= 0.0) continue;

    farm.month.roll_to(day.date);
    const double share = capacity_share(scenario_, fi);

    WaterPolicyContext ctx;
    ctx.demand_m3 = demand;
    ctx.available_energy_kwh = day.available_energy_kwh;
    ctx.energy_price_usd_per_kwh = day.energy_price_usd_per_kwh;
    ctx.municipal_price_usd_per_m3 =
        tiers ? marginal_tier_price(farm.month.municipal_m3, *tiers) : day.municipal_price_usd_per_m3;
    ctx.pumping_kwh_per_m3 = day.pumping_kwh_per_m3;
    ctx.conveyance_kwh_per_m3 = cfg_.conveyance_kwh_per_m3;
    ctx.treatment_kwh_per_m3 = treatment_kwh_per_m3_;
    ctx.gw_maintenance_usd_per_m3 = cfg_.gw_maintenance_usd_per_m3;
    ctx.groundwater_used_this_month_m3 = farm.month.groundwater_m3;
    ctx.groundwater_used_this_year_m3 = farm.year.groundwater_m3;
    ctx.current_month = day.month;
    ctx.max_groundwater_m3 = well_capacity_m3_day(scenario_) * share;
    ctx.max_treatment_m3 = scenario_.treatment.capacity_m3_day * share;

    WaterAllocation alloc = water_policies_[fi]->allocate(ctx);

    int tier = 0;
    double tier_rate = 0.0;
    if (tiers && alloc.municipal_m3 > 0.0) {
      const TieredCharge charge = tiered_charge(alloc.municipal_m3, farm.month.municipal_m3, *tiers);
      alloc.cost_usd = alloc.groundwater_m3 * alloc.gw_cost_per_m3 + charge.total_cost;
      tier = charge.marginal_tier;
      tier_rate = charge.cost_per_unit;
    }

    record_water_allocation(farm, day.date, demand, alloc, per_planting, tier, tier_rate);
    state_.aquifer.record_extraction(alloc.groundwater_m3);

    day.irrigation_groundwater_m3 += alloc.groundwater_m3;
    day.irrigation_municipal_m3 += alloc.municipal_m3;
    day.water_energy_kwh += alloc.energy_used_kwh;
    if (std::isfinite(day.available_energy_kwh)) {
      day.available_energy_kwh = std::max(0.0, day.available_energy_kwh - alloc.energy_used_kwh);
    }
  }
}

// Treated water passes through the tank the same day. Only community water is
// buffered; irrigation groundwater is recorded as throughput.
void Simulation::tick_storage(const DayContext& day) {
  const double domestic = day.domestic_water_m3();
  state_.storage.add_inflow(domestic);
  state_.storage.draw_outflow(domestic);

  const double treated = day.irrigation_groundwater_m3 + domestic;
  state_.storage.record_daily(day.date, treated, treated, day.irrigation_groundwater_m3, day.household_water_m3,
                              day.building_water_m3);
}

} // namespace agripv
