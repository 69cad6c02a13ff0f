#include "agripv/core/simulation.h"

#include "simulation_internal.h"

namespace agripv {

// One community-wide dispatch per day covering water pumping/treatment plus
// household and building load. Generator fuel is paid at today's diesel price.
void Simulation::tick_energy(const DayContext& day) {
  const double demand = day.water_energy_kwh + day.household_energy_kwh + day.building_energy_kwh;
  const DailyEnergyRecord rec = dispatch_energy(state_.energy, day.date, demand, day.renewables);

  if (rec.generator_fuel_l > 0.0) {
    const double diesel = rec.generator_fuel_l * data_->diesel_price_usd_per_l(day.date);
    state_.community.diesel_cost_usd += diesel;
    add_operating_cost(state_.economics, diesel);
  }
}

} // namespace agripv
