#pragma once

#include <map>
#include <string>
#include <vector>

#include "agripv/core/crop.h"
#include "agripv/core/date.h"
#include "agripv/core/scenario.h"
#include "agripv/core/water_policy.h"

namespace agripv {

class DataProvider;

// Consumption within the current calendar month (quota and tier tracking).
struct MonthlyConsumption {
  int year{0};
  int month{0};
  double water_m3{0.0};
  double groundwater_m3{0.0};
  double municipal_m3{0.0};
  double energy_kwh{0.0};

  // Zeroes the counters when `d` falls in another month than the one tracked.
  void roll_to(Date d);
};

struct DailyWaterRecord {
  Date date;
  std::string farm_id;
  double demand_m3{0.0};
  double groundwater_m3{0.0};
  double municipal_m3{0.0};
  double energy_kwh{0.0};
  double cost_usd{0.0};
  std::string decision_reason;
  std::string limiting_factor;
  double gw_cost_per_m3{0.0};
  double muni_cost_per_m3{0.0};
  // Set under tiered municipal pricing, otherwise 0.
  int water_tier{0};
  double tier_effective_rate{0.0};

  double delivered_m3() const { return groundwater_m3 + municipal_m3; }
};

struct FarmYearTotals {
  double groundwater_m3{0.0};
  double municipal_m3{0.0};
  double water_cost_usd{0.0};
  double energy_kwh{0.0};

  double yield_kg{0.0};
  double crop_revenue_usd{0.0};
  double fresh_revenue_usd{0.0};
  double processed_revenue_usd{0.0};
  double processed_output_kg{0.0};
  double post_harvest_loss_kg{0.0};
  double fertilizer_cost_usd{0.0};

  // Water credited to each crop this year.
  std::map<std::string, double> crop_water_m3;

  double total_water_m3() const { return groundwater_m3 + municipal_m3; }
};

struct CropYearSummary {
  double water_m3{0.0};
  double yield_kg{0.0};
  double revenue_usd{0.0};
};

struct YearlyFarmMetrics {
  int year{0};
  std::string farm_id;
  std::string farm_name;
  FarmYearTotals totals;
  // Per crop: water credited this year, plus yield/revenue of harvested seasons
  // planted this year.
  std::map<std::string, CropYearSummary> crops;

  double water_per_yield_m3_per_kg{0.0};
  double water_cost_per_m3{0.0};
  // Groundwater share of delivered water, 0..100.
  double self_sufficiency_pct{0.0};
};

struct FarmState {
  std::string id;
  std::string name;
  double area_ha{0.0};
  std::string water_policy;
  std::string food_policy;
  double starting_capital_usd{0.0};

  // Append-only season history.
  std::vector<CropPlanting> plantings;

  FarmYearTotals year;
  MonthlyConsumption month;
  std::vector<DailyWaterRecord> daily_water;
};

FarmState make_farm_state(const FarmConfig& cfg);

// Irrigation demand of every active planting on `date`. `per_planting` is resized to
// plantings.size() and holds each planting's share (0 for inactive ones).
double farm_irrigation_demand(const FarmState& farm, Date date, const DataProvider& data,
                              std::vector<double>& per_planting);

// Books a day's allocation: year totals, monthly tracker, audit row and crop water.
// Each active planting is credited demand x (delivered / total demand).
void record_water_allocation(FarmState& farm, Date date, double demand_m3, const WaterAllocation& alloc,
                             const std::vector<double>& per_planting, int water_tier = 0,
                             double tier_effective_rate = 0.0);

// Adds a harvested planting's yield and revenue to the year totals.
void record_harvest(FarmState& farm, const CropPlanting& p);

YearlyFarmMetrics snapshot_farm_year(const FarmState& farm, int year);
void reset_farm_year(FarmState& farm);

} // namespace agripv
