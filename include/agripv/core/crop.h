#pragma once

#include <optional>
#include <string>
#include <vector>

#include "agripv/core/date.h"
#include "agripv/core/scenario.h"

namespace agripv {

class DataProvider;

struct CropPlanting {
  std::string crop;
  Date planting_date;
  Date harvest_date;
  double area_ha{0.0};
  double expected_yield_kg_per_ha{0.0};
  // Sum of daily demand x area over [planting, harvest].
  double expected_total_water_m3{0.0};

  double cumulative_water_m3{0.0};
  bool harvested{false};

  // Filled in at harvest.
  double water_stress_factor{1.0};
  double harvest_yield_kg{0.0};
  ProcessingSplit processing;
  double fresh_revenue_usd{0.0};
  double processed_revenue_usd{0.0};
  double processed_output_kg{0.0};
  double post_harvest_loss_kg{0.0};

  double expected_total_yield_kg() const { return expected_yield_kg_per_ha * area_ha; }
  double total_revenue_usd() const { return fresh_revenue_usd + processed_revenue_usd; }

  // Growing on `d` and not yet harvested.
  bool is_active(Date d) const { return !harvested && planting_date <= d && d <= harvest_date; }
};

// FAO-33 stress factor: clamp(1 - ky * (1 - min(1, received / expected)), 0, 1).
// A planting that needs no water is never stressed.
double water_stress_factor(double received_m3, double expected_m3, double ky);

// Builds one season of `plan` on `farm` starting `mm_dd` of `year`.
//
// Returns nullopt when the tables have no yield curve for that crop/date. The caller
// decides whether that is an error. Throws std::invalid_argument for a malformed date.
std::optional<CropPlanting> plan_crop_planting(const FarmConfig& farm, const CropPlan& plan, int year,
                                               const std::string& mm_dd, const DataProvider& data);

// Applies the stress factor and the processing split to a grown planting and marks it
// harvested. Pathways with a zero share are not looked up.
void harvest_planting(CropPlanting& p, double ky, double fresh_price_usd_per_kg, const ProcessingSplit& split,
                      const DataProvider& data);

// Human-readable descriptions of same-crop seasons whose [planting, harvest] ranges
// overlap. Empty when the schedule is consistent.
std::vector<std::string> find_planting_overlaps(const std::vector<CropPlanting>& plantings);

} // namespace agripv
