#pragma once

#include <string>
#include <vector>

#include "agripv/core/date.h"
#include "agripv/core/scenario.h"

namespace agripv {

class DataProvider;

struct DailyEnergyRecord {
  Date date;
  double demand_kwh{0.0};
  double pv_kwh{0.0};
  double wind_kwh{0.0};
  double battery_charge_kwh{0.0};
  double battery_discharge_kwh{0.0};
  double soc_after{0.0};
  double grid_import_kwh{0.0};
  double grid_export_kwh{0.0};
  double generator_kwh{0.0};
  double generator_fuel_l{0.0};
  double generator_hours{0.0};
  double curtailed_kwh{0.0};
  // Deficit nobody could serve (off-grid, generator too small or absent).
  double unmet_kwh{0.0};

  double renewable_kwh() const { return pv_kwh + wind_kwh; }
};

// Running totals for the current simulation year.
struct EnergyYearTotals {
  double demand_kwh{0.0};
  double pv_kwh{0.0};
  double wind_kwh{0.0};
  double grid_import_kwh{0.0};
  double grid_export_kwh{0.0};
  double generator_kwh{0.0};
  double generator_fuel_l{0.0};
  double battery_charge_kwh{0.0};
  double battery_discharge_kwh{0.0};
  double curtailed_kwh{0.0};
  double unmet_kwh{0.0};
};

struct YearlyEnergyMetrics {
  int year{0};
  EnergyYearTotals totals;
  double soc_end{0.0};
  // Renewable share of demand served on site (0..100).
  double self_sufficiency_pct{0.0};
};

// Community energy system. Battery SOC persists for the whole run; the year
// totals are cleared at every year boundary.
struct EnergyState {
  double pv_capacity_kw{0.0};
  std::string pv_density{"medium"};
  double wind_capacity_kw{0.0};
  std::string wind_turbine{"medium"};

  double battery_capacity_kwh{0.0};
  double soc{0.5};
  double soc_min{0.10};
  double soc_max{0.90};
  double charge_efficiency{0.95};
  double discharge_efficiency{0.95};

  double generator_capacity_kw{0.0};
  double fuel_coeff_a{0.06};
  double fuel_coeff_b{0.20};

  bool grid_connected{true};

  EnergyYearTotals year;
  std::vector<DailyEnergyRecord> daily_records;
  double cumulative_battery_charge_kwh{0.0};
  double cumulative_battery_discharge_kwh{0.0};
};

EnergyState make_energy_state(const Scenario& sc);

// Crop-level shading behind the panels: low 0.95, medium 0.90, high 0.85.
// Throws std::invalid_argument for another density.
double pv_shading_factor(const std::string& density);

struct RenewableOutput {
  double pv_kwh{0.0};
  double wind_kwh{0.0};

  double total_kwh() const { return pv_kwh + wind_kwh; }
};

// Today's PV and wind output. PV degrades geometrically with years since `start`.
// Zero-capacity sources are skipped without touching the lookup tables.
RenewableOutput renewable_output(const EnergyState& s, const DataProvider& data, Date date, Date start,
                                 double degradation_rate_per_yr);

// Merit-order dispatch of one day's demand: renewables, then battery, then grid,
// then generator. Mutates SOC and the year totals, appends the daily record and
// returns a copy of it.
DailyEnergyRecord dispatch_energy(EnergyState& s, Date date, double demand_kwh, const RenewableOutput& gen);

YearlyEnergyMetrics snapshot_energy_year(const EnergyState& s, int year);
void reset_energy_year(EnergyState& s);

} // namespace agripv
