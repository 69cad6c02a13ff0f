#include "agripv/core/energy_dispatch.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "agripv/core/data_provider.h"

namespace agripv {

EnergyState make_energy_state(const Scenario& sc) {
  EnergyState s;
  s.pv_capacity_kw = sc.pv.sys_capacity_kw;
  s.pv_density = sc.pv.density;
  s.wind_capacity_kw = sc.wind.sys_capacity_kw;
  s.wind_turbine = sc.wind.turbine;
  s.battery_capacity_kwh = sc.battery.capacity_kwh;
  s.soc_min = sc.battery.soc_min;
  s.soc_max = sc.battery.soc_max;
  s.soc = std::clamp(sc.battery.initial_soc, s.soc_min, s.soc_max);
  s.charge_efficiency = sc.battery.charge_efficiency;
  s.discharge_efficiency = sc.battery.discharge_efficiency;
  s.generator_capacity_kw = sc.generator.capacity_kw;
  s.fuel_coeff_a = sc.generator.fuel_coeff_a;
  s.fuel_coeff_b = sc.generator.fuel_coeff_b;
  s.grid_connected = sc.grid_connected;
  return s;
}

double pv_shading_factor(const std::string& density) {
  if (density == "low") return 0.95;
  if (density == "medium") return 0.90;
  if (density == "high") return 0.85;
  throw std::invalid_argument("Unknown PV density '" + density + "' (expected low, medium or high)");
}

RenewableOutput renewable_output(const EnergyState& s, const DataProvider& data, Date date, Date start,
                                 double degradation_rate_per_yr) {
  RenewableOutput out;
  if (s.pv_capacity_kw > 0.0) {
    const double years = static_cast<double>(date - start) / 365.25;
    const double degradation = std::pow(1.0 - degradation_rate_per_yr, years);
    out.pv_kwh = s.pv_capacity_kw * data.pv_kwh_per_kw(date, s.pv_density) * degradation *
                 pv_shading_factor(s.pv_density);
  }
  if (s.wind_capacity_kw > 0.0) {
    out.wind_kwh = s.wind_capacity_kw * data.wind_kwh_per_kw(date, s.wind_turbine);
  }
  return out;
}

DailyEnergyRecord dispatch_energy(EnergyState& s, Date date, double demand_kwh, const RenewableOutput& gen) {
  if (demand_kwh < 0.0) throw std::invalid_argument("energy demand must be >= 0");

  DailyEnergyRecord r;
  r.date = date;
  r.demand_kwh = demand_kwh;
  r.pv_kwh = gen.pv_kwh;
  r.wind_kwh = gen.wind_kwh;

  const bool has_battery = s.battery_capacity_kwh > 0.0;
  const double net = gen.total_kwh() - demand_kwh;

  if (net >= 0.0) {
    double surplus = net;
    if (has_battery) {
      const double room_kwh = std::max(0.0, (s.soc_max - s.soc) * s.battery_capacity_kwh);
      r.battery_charge_kwh = std::min(surplus, room_kwh / s.charge_efficiency);
      surplus -= r.battery_charge_kwh;
    }
    if (s.grid_connected) {
      r.grid_export_kwh = surplus;
    } else {
      r.curtailed_kwh = surplus;
    }
  } else {
    double deficit = -net;
    if (has_battery) {
      const double available_kwh = std::max(0.0, (s.soc - s.soc_min) * s.battery_capacity_kwh * s.discharge_efficiency);
      r.battery_discharge_kwh = std::min(deficit, available_kwh);
      deficit -= r.battery_discharge_kwh;
    }
    if (deficit > 0.0 && s.grid_connected) {
      r.grid_import_kwh = deficit;
      deficit = 0.0;
    }
    if (deficit > 0.0 && s.generator_capacity_kw > 0.0) {
      // Runs at rated load for as few hours as the deficit needs.
      const double p = s.generator_capacity_kw;
      r.generator_kwh = std::min(deficit, p * 24.0);
      r.generator_hours = r.generator_kwh / p;
      r.generator_fuel_l = (s.fuel_coeff_a * p + s.fuel_coeff_b * p) * r.generator_hours;
      deficit -= r.generator_kwh;
    }
    r.unmet_kwh = std::max(0.0, deficit);
  }

  if (has_battery) {
    s.soc += (r.battery_charge_kwh * s.charge_efficiency - r.battery_discharge_kwh / s.discharge_efficiency) /
             s.battery_capacity_kwh;
    s.soc = std::clamp(s.soc, s.soc_min, s.soc_max);
  }
  r.soc_after = s.soc;

  EnergyYearTotals& y = s.year;
  y.demand_kwh += r.demand_kwh;
  y.pv_kwh += r.pv_kwh;
  y.wind_kwh += r.wind_kwh;
  y.grid_import_kwh += r.grid_import_kwh;
  y.grid_export_kwh += r.grid_export_kwh;
  y.generator_kwh += r.generator_kwh;
  y.generator_fuel_l += r.generator_fuel_l;
  y.battery_charge_kwh += r.battery_charge_kwh;
  y.battery_discharge_kwh += r.battery_discharge_kwh;
  y.curtailed_kwh += r.curtailed_kwh;
  y.unmet_kwh += r.unmet_kwh;
  s.cumulative_battery_charge_kwh += r.battery_charge_kwh;
  s.cumulative_battery_discharge_kwh += r.battery_discharge_kwh;

  s.daily_records.push_back(r);
  return r;
}

YearlyEnergyMetrics snapshot_energy_year(const EnergyState& s, int year) {
  YearlyEnergyMetrics m;
  m.year = year;
  m.totals = s.year;
  m.soc_end = s.soc;
  if (s.year.demand_kwh > 0.0) {
    const double bought = s.year.grid_import_kwh + s.year.generator_kwh + s.year.unmet_kwh;
    m.self_sufficiency_pct = std::clamp((s.year.demand_kwh - bought) / s.year.demand_kwh * 100.0, 0.0, 100.0);
  }
  return m;
}

void reset_energy_year(EnergyState& s) { s.year = EnergyYearTotals{}; }

} // namespace agripv
