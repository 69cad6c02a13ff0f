#include "agripv/core/scenario_validation.h"

#include <set>
#include <stdexcept>

#include "agripv/core/energy_dispatch.h"
#include "agripv/core/food_policy.h"
#include "agripv/core/water_policy.h"

namespace agripv {
namespace {

void require(bool ok, std::vector<std::string>& errors, const std::string& msg) {
  if (!ok) errors.push_back(msg);
}

bool in_unit_range(double v) { return v >= 0.0 && v <= 1.0; }

void check_split(const ProcessingSplit& split, const std::string& context, std::vector<std::string>& errors) {
  try {
    check_processing_split(split, context);
  } catch (const std::invalid_argument& e) {
    errors.push_back(e.what());
  }
}

// Planting dates repeat every simulated year, so "02-29" is only valid when every
// year of the horizon is a leap year.
void check_farm(const FarmConfig& f, std::size_t index, int first_year, int last_year,
                std::vector<std::string>& errors) {
  const std::string ctx = "farm[" + std::to_string(index) + "] '" + f.id + "'";
  require(!f.id.empty(), errors, ctx + ": id must not be empty");
  require(f.area_ha > 0.0, errors, ctx + ": area_ha must be > 0");
  require(f.yield_factor >= 0.0, errors, ctx + ": yield_factor must be >= 0");

  WaterPolicyKind wk;
  if (!water_policy_kind_from_string(f.water_policy, &wk)) {
    errors.push_back(ctx + ": unknown water policy '" + f.water_policy + "'");
  } else if (wk == WaterPolicyKind::QuotaEnforced) {
    require(f.water_policy_params.annual_quota_m3 >= 0.0, errors, ctx + ": annual_quota_m3 must be >= 0");
    require(f.water_policy_params.monthly_variance_pct >= 0.0, errors, ctx + ": monthly_variance_pct must be >= 0");
  } else if (wk == WaterPolicyKind::ConserveGroundwater) {
    require(f.water_policy_params.price_threshold_multiplier > 0.0, errors,
            ctx + ": price_threshold_multiplier must be > 0");
    require(in_unit_range(f.water_policy_params.max_gw_ratio), errors, ctx + ": max_gw_ratio must be in [0, 1]");
  }

  if (!food_policy_kind_from_string(f.food_policy, nullptr)) {
    errors.push_back(ctx + ": unknown food policy '" + f.food_policy + "'");
  }
  const FoodPolicyParams& fp = f.food_policy_params;
  if (fp.split) check_split(*fp.split, ctx + " food split", errors);
  if (fp.low_price_split) check_split(*fp.low_price_split, ctx + " low-price split", errors);
  if (fp.normal_price_split) check_split(*fp.normal_price_split, ctx + " normal-price split", errors);

  double area_fraction_total = 0.0;
  for (const auto& c : f.crops) {
    const std::string cctx = ctx + " crop '" + c.name + "'";
    require(!c.name.empty(), errors, ctx + ": crop name must not be empty");
    require(in_unit_range(c.area_fraction), errors, cctx + ": area_fraction must be in [0, 1]");
    require(in_unit_range(c.percent_planted), errors, cctx + ": percent_planted must be in [0, 1]");
    area_fraction_total += c.area_fraction;
    for (const auto& d : c.planting_dates) {
      for (int year = first_year; year <= last_year; ++year) {
        try {
          (void)Date::parse_month_day(year, d);
        } catch (const std::invalid_argument& e) {
          errors.push_back(cctx + ": planting date '" + d + "' in " + std::to_string(year) + ": " + e.what());
          break;
        }
      }
    }
  }
  require(area_fraction_total <= 1.0 + 1e-9, errors, ctx + ": crop area fractions exceed 1.0");
}

} // namespace

std::vector<std::string> validate_scenario(const Scenario& sc) {
  std::vector<std::string> errors;

  require(sc.start_date <= sc.end_date, errors,
          "end_date " + sc.end_date.to_string() + " is before start_date " + sc.start_date.to_string());

  require(sc.wells.well_depth_m >= 0.0, errors, "wells: well_depth_m must be >= 0");
  require(sc.wells.well_flow_rate_m3_day >= 0.0, errors, "wells: well_flow_rate_m3_day must be >= 0");
  require(sc.wells.number_of_wells >= 0, errors, "wells: number_of_wells must be >= 0");
  require(sc.wells.pipe_distance_km >= 0.0, errors, "wells: pipe_distance_km must be >= 0");
  require(sc.wells.pipe_diameter_m > 0.0, errors, "wells: pipe_diameter_m must be > 0");
  require(sc.wells.pump_efficiency > 0.0 && sc.wells.pump_efficiency <= 1.0, errors,
          "wells: pump_efficiency must be in (0, 1]");
  require(sc.treatment.capacity_m3_day >= 0.0, errors, "treatment: capacity_m3_day must be >= 0");
  require(sc.storage.capacity_m3 >= 0.0, errors, "storage: capacity_m3 must be >= 0");

  require(sc.pv.sys_capacity_kw >= 0.0, errors, "pv: sys_capacity_kw must be >= 0");
  try {
    (void)pv_shading_factor(sc.pv.density);
  } catch (const std::invalid_argument& e) {
    errors.push_back(std::string("pv: ") + e.what());
  }
  require(sc.wind.sys_capacity_kw >= 0.0, errors, "wind: sys_capacity_kw must be >= 0");

  const BatteryConfig& b = sc.battery;
  require(b.capacity_kwh >= 0.0, errors, "battery: capacity_kwh must be >= 0");
  require(in_unit_range(b.soc_min) && in_unit_range(b.soc_max) && b.soc_min <= b.soc_max, errors,
          "battery: require 0 <= soc_min <= soc_max <= 1");
  require(b.initial_soc >= b.soc_min && b.initial_soc <= b.soc_max, errors,
          "battery: initial_soc must lie within [soc_min, soc_max]");
  require(b.charge_efficiency > 0.0 && b.charge_efficiency <= 1.0, errors,
          "battery: charge_efficiency must be in (0, 1]");
  require(b.discharge_efficiency > 0.0 && b.discharge_efficiency <= 1.0, errors,
          "battery: discharge_efficiency must be in (0, 1]");

  require(sc.generator.capacity_kw >= 0.0, errors, "generator: capacity_kw must be >= 0");
  require(sc.generator.fuel_coeff_a >= 0.0 && sc.generator.fuel_coeff_b >= 0.0, errors,
          "generator: fuel coefficients must be >= 0");

  require(sc.aquifer.exploitable_volume_m3 >= 0.0, errors, "aquifer: exploitable_volume_m3 must be >= 0");
  require(sc.aquifer.recharge_rate_m3_yr >= 0.0, errors, "aquifer: recharge_rate_m3_yr must be >= 0");
  require(sc.aquifer.max_drawdown_m >= 0.0, errors, "aquifer: max_drawdown_m must be >= 0");

  if (sc.pricing.agricultural_water_tiers) {
    const TierPricing& t = *sc.pricing.agricultural_water_tiers;
    require(!t.brackets.empty(), errors, "tiered pricing: at least one bracket required");
    for (std::size_t i = 0; i < t.brackets.size(); ++i) {
      const TierBracket& br = t.brackets[i];
      const std::string bctx = "tiered pricing bracket[" + std::to_string(i) + "]";
      require(br.max_units > br.min_units, errors, bctx + ": max_units must exceed min_units");
      require(br.price_per_unit >= 0.0, errors, bctx + ": price_per_unit must be >= 0");
      if (i > 0) {
        require(br.min_units >= t.brackets[i - 1].max_units - 1e-9, errors,
                bctx + ": brackets must be sorted and non-overlapping");
      }
    }
    require(t.wastewater_surcharge_pct >= 0.0, errors, "tiered pricing: wastewater_surcharge_pct must be >= 0");
  }

  require(!sc.farms.empty(), errors, "scenario has no farms");
  // A reversed horizon is already reported; still check the date format once.
  const int first_year = sc.start_date.year();
  const int last_year = sc.start_date <= sc.end_date ? sc.end_date.year() : first_year;
  std::set<std::string> ids;
  for (std::size_t i = 0; i < sc.farms.size(); ++i) {
    const FarmConfig& f = sc.farms[i];
    if (!f.id.empty() && !ids.insert(f.id).second) errors.push_back("duplicate farm id '" + f.id + "'");
    check_farm(f, i, first_year, last_year, errors);
  }

  return errors;
}

} // namespace agripv
