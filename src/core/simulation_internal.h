#pragma once

// Helpers shared by the Simulation translation units. Not part of the public API.

#include <cstddef>
#include <limits>

#include "agripv/core/energy_dispatch.h"
#include "agripv/core/simulation.h"

namespace agripv {

// Everything computed once per day and shared by the tick phases.
struct Simulation::DayContext {
  Date date;
  int month{1};

  double energy_price_usd_per_kwh{0.0};
  double municipal_price_usd_per_m3{0.0};

  // Re-derived each day from the current aquifer head.
  double pumping_kwh_per_m3{0.0};
  double groundwater_kwh_per_m3{0.0};

  RenewableOutput renewables;
  // Renewable energy not yet claimed by groundwater pumping today.
  double available_energy_kwh{std::numeric_limits<double>::infinity()};

  double household_water_m3{0.0};
  double building_water_m3{0.0};
  double household_energy_kwh{0.0};
  double building_energy_kwh{0.0};

  double irrigation_groundwater_m3{0.0};
  double irrigation_municipal_m3{0.0};
  // Pumping, conveyance and treatment for irrigation and domestic water.
  double water_energy_kwh{0.0};

  double domestic_water_m3() const { return household_water_m3 + building_water_m3; }
};

namespace sim_internal {

// Area-proportional share of the community's well and treatment capacity.
// Equal shares when no farm has area.
inline double capacity_share(const Scenario& sc, std::size_t farm_index) {
  const double total = sc.total_farm_area_ha();
  if (total > 0.0) return sc.farms[farm_index].area_ha / total;
  return sc.farms.empty() ? 0.0 : 1.0 / static_cast<double>(sc.farms.size());
}

inline double well_capacity_m3_day(const Scenario& sc) {
  return sc.wells.well_flow_rate_m3_day * static_cast<double>(sc.wells.number_of_wells);
}

} // namespace sim_internal
} // namespace agripv
