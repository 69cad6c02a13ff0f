#include "agripv/core/farm.h"

#include <algorithm>
#include <stdexcept>

#include "agripv/core/data_provider.h"

namespace agripv {

void MonthlyConsumption::roll_to(Date d) {
  const auto ymd = d.to_ymd();
  if (ymd.year == year && ymd.month == month) return;
  *this = MonthlyConsumption{};
  year = ymd.year;
  month = ymd.month;
}

FarmState make_farm_state(const FarmConfig& cfg) {
  FarmState f;
  f.id = cfg.id;
  f.name = cfg.name.empty() ? cfg.id : cfg.name;
  f.area_ha = cfg.area_ha;
  f.water_policy = cfg.water_policy;
  f.food_policy = cfg.food_policy;
  f.starting_capital_usd = cfg.starting_capital_usd;
  return f;
}

double farm_irrigation_demand(const FarmState& farm, Date date, const DataProvider& data,
                              std::vector<double>& per_planting) {
  per_planting.assign(farm.plantings.size(), 0.0);
  double total = 0.0;
  for (std::size_t i = 0; i < farm.plantings.size(); ++i) {
    const CropPlanting& p = farm.plantings[i];
    if (!p.is_active(date)) continue;
    per_planting[i] = data.irrigation_m3_per_ha(p.crop, p.planting_date, date) * p.area_ha;
    total += per_planting[i];
  }
  return total;
}

void record_water_allocation(FarmState& farm, Date date, double demand_m3, const WaterAllocation& alloc,
                             const std::vector<double>& per_planting, int water_tier, double tier_effective_rate) {
  if (per_planting.size() != farm.plantings.size()) {
    throw std::invalid_argument("per-planting demand does not match planting list for farm " + farm.id);
  }

  FarmYearTotals& y = farm.year;
  y.groundwater_m3 += alloc.groundwater_m3;
  y.municipal_m3 += alloc.municipal_m3;
  y.water_cost_usd += alloc.cost_usd;
  y.energy_kwh += alloc.energy_used_kwh;

  farm.month.roll_to(date);
  farm.month.water_m3 += alloc.total_m3();
  farm.month.groundwater_m3 += alloc.groundwater_m3;
  farm.month.municipal_m3 += alloc.municipal_m3;
  farm.month.energy_kwh += alloc.energy_used_kwh;

  DailyWaterRecord r;
  r.date = date;
  r.farm_id = farm.id;
  r.demand_m3 = demand_m3;
  r.groundwater_m3 = alloc.groundwater_m3;
  r.municipal_m3 = alloc.municipal_m3;
  r.energy_kwh = alloc.energy_used_kwh;
  r.cost_usd = alloc.cost_usd;
  r.decision_reason = alloc.reason_label();
  r.limiting_factor = alloc.limiting_factor;
  r.gw_cost_per_m3 = alloc.gw_cost_per_m3;
  r.muni_cost_per_m3 = alloc.muni_cost_per_m3;
  r.water_tier = water_tier;
  r.tier_effective_rate = tier_effective_rate;
  farm.daily_water.push_back(r);

  const double ratio = demand_m3 > 0.0 ? std::min(1.0, alloc.total_m3() / demand_m3) : 0.0;
  for (std::size_t i = 0; i < farm.plantings.size(); ++i) {
    if (per_planting[i] <= 0.0) continue;
    CropPlanting& p = farm.plantings[i];
    const double credit = per_planting[i] * ratio;
    p.cumulative_water_m3 += credit;
    y.crop_water_m3[p.crop] += credit;
  }
}

void record_harvest(FarmState& farm, const CropPlanting& p) {
  FarmYearTotals& y = farm.year;
  y.yield_kg += p.harvest_yield_kg;
  y.crop_revenue_usd += p.total_revenue_usd();
  y.fresh_revenue_usd += p.fresh_revenue_usd;
  y.processed_revenue_usd += p.processed_revenue_usd;
  y.processed_output_kg += p.processed_output_kg;
  y.post_harvest_loss_kg += p.post_harvest_loss_kg;
}

YearlyFarmMetrics snapshot_farm_year(const FarmState& farm, int year) {
  YearlyFarmMetrics m;
  m.year = year;
  m.farm_id = farm.id;
  m.farm_name = farm.name;
  m.totals = farm.year;

  for (const auto& [crop, water] : farm.year.crop_water_m3) m.crops[crop].water_m3 = water;
  for (const auto& p : farm.plantings) {
    if (!p.harvested || p.planting_date.year() != year) continue;
    CropYearSummary& c = m.crops[p.crop];
    c.yield_kg += p.harvest_yield_kg;
    c.revenue_usd += p.total_revenue_usd();
  }

  const double water = farm.year.total_water_m3();
  if (farm.year.yield_kg > 0.0) m.water_per_yield_m3_per_kg = water / farm.year.yield_kg;
  if (water > 0.0) {
    m.water_cost_per_m3 = farm.year.water_cost_usd / water;
    m.self_sufficiency_pct = farm.year.groundwater_m3 / water * 100.0;
  }
  return m;
}

void reset_farm_year(FarmState& farm) { farm.year = FarmYearTotals{}; }

} // namespace agripv
