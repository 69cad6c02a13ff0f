#include "agripv/core/simulation.h"

#include "simulation_internal.h"

#include "agripv/core/crop.h"
#include "agripv/util/log.h"
#include "agripv/util/strings.h"

namespace agripv {

void Simulation::tick_harvests(const DayContext& day) {
  for (std::size_t fi = 0; fi < state_.farms.size(); ++fi) {
    FarmState& farm = state_.farms[fi];
    for (CropPlanting& p : farm.plantings) {
      if (p.harvested || p.harvest_date > day.date) continue;

      const double ky = data_->yield_response_factor(p.crop);
      const double price = data_->crop_price_usd_per_kg(p.crop, day.date);

      FoodPolicyContext ctx;
      ctx.crop = p.crop;
      ctx.harvest_yield_kg =
          p.expected_total_yield_kg() * water_stress_factor(p.cumulative_water_m3, p.expected_total_water_m3, ky);
      ctx.fresh_price_usd_per_kg = price;
      const ProcessingSplit split = food_policies_[fi]->allocate(ctx);

      harvest_planting(p, ky, price, split, *data_);
      record_harvest(farm, p);

      log::debug(farm.id + ": harvested " + p.crop + " planted " + p.planting_date.to_string() + ", " +
                 format_fixed(p.harvest_yield_kg, 0) + " kg (stress factor " + format_fixed(p.water_stress_factor, 3) +
                 "), $" + format_fixed(p.total_revenue_usd(), 0));
    }
  }
}

} // namespace agripv
