#include "agripv/core/crop.h"

#include <algorithm>
#include <map>

#include "agripv/core/data_provider.h"
#include "agripv/core/food_policy.h"

namespace agripv {

double water_stress_factor(double received_m3, double expected_m3, double ky) {
  const double ratio = expected_m3 > 0.0 ? std::min(1.0, received_m3 / expected_m3) : 1.0;
  return std::clamp(1.0 - ky * (1.0 - ratio), 0.0, 1.0);
}

std::optional<CropPlanting> plan_crop_planting(const FarmConfig& farm, const CropPlan& plan, int year,
                                               const std::string& mm_dd, const DataProvider& data) {
  const Date planting = Date::parse_month_day(year, mm_dd);
  const std::optional<YieldInfo> yield = data.yield_info(plan.name, planting);
  if (!yield) return std::nullopt;

  CropPlanting p;
  p.crop = plan.name;
  p.planting_date = planting;
  p.harvest_date = yield->harvest_date;
  p.area_ha = farm.area_ha * plan.area_fraction * plan.percent_planted;
  p.expected_yield_kg_per_ha = yield->yield_kg_per_ha * farm.yield_factor;

  double per_ha = 0.0;
  for (Date d = planting; d <= p.harvest_date; d = d.add_days(1)) {
    per_ha += data.irrigation_m3_per_ha(plan.name, planting, d);
  }
  p.expected_total_water_m3 = per_ha * p.area_ha;
  return p;
}

void harvest_planting(CropPlanting& p, double ky, double fresh_price_usd_per_kg, const ProcessingSplit& split,
                      const DataProvider& data) {
  p.water_stress_factor = water_stress_factor(p.cumulative_water_m3, p.expected_total_water_m3, ky);
  p.harvest_yield_kg = p.expected_total_yield_kg() * p.water_stress_factor;
  p.processing = split;
  p.fresh_revenue_usd = 0.0;
  p.processed_revenue_usd = 0.0;
  p.processed_output_kg = 0.0;
  p.post_harvest_loss_kg = 0.0;

  for (const ProcessingPathway pathway : kAllPathways) {
    const double fraction = split_fraction(split, pathway);
    if (fraction <= 0.0) continue;
    const PathwayParams params = data.pathway_params(p.crop, pathway);

    const double raw_kg = p.harvest_yield_kg * fraction;
    const double output_kg = raw_kg * (1.0 - params.weight_loss);
    const double sellable_kg = output_kg * (1.0 - params.post_harvest_loss);
    const double revenue = sellable_kg * fresh_price_usd_per_kg * params.value_multiplier;

    p.post_harvest_loss_kg += raw_kg - sellable_kg;
    if (pathway == ProcessingPathway::Fresh) {
      p.fresh_revenue_usd += revenue;
    } else {
      p.processed_revenue_usd += revenue;
      p.processed_output_kg += output_kg;
    }
  }
  p.harvested = true;
}

std::vector<std::string> find_planting_overlaps(const std::vector<CropPlanting>& plantings) {
  std::map<std::string, std::vector<const CropPlanting*>> by_crop;
  for (const auto& p : plantings) by_crop[p.crop].push_back(&p);

  std::vector<std::string> out;
  for (auto& [crop, list] : by_crop) {
    std::sort(list.begin(), list.end(),
              [](const CropPlanting* a, const CropPlanting* b) { return a->planting_date < b->planting_date; });
    for (std::size_t i = 1; i < list.size(); ++i) {
      const CropPlanting& prev = *list[i - 1];
      const CropPlanting& next = *list[i];
      if (prev.harvest_date >= next.planting_date) {
        out.push_back(crop + " season planted " + prev.planting_date.to_string() + " (harvest " +
                      prev.harvest_date.to_string() + ") overlaps season planted " + next.planting_date.to_string());
      }
    }
  }
  return out;
}

} // namespace agripv
