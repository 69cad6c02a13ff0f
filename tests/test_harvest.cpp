#include <cmath>
#include <iostream>
#include <memory>

#include "agripv/core/crop.h"
#include "agripv/core/data_provider.h"

#define AGRIPV_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

agripv::LookupTables tomato_tables() {
  using agripv::Date;
  agripv::LookupTables t;
  agripv::CropTable c;
  c.ky = 1.05;
  c.price_usd_per_kg = agripv::DailySeries(0.5);
  c.pathways[agripv::ProcessingPathway::Fresh] = agripv::PathwayParams{0.0, 0.10, 1.0};
  c.pathways[agripv::ProcessingPathway::Dried] = agripv::PathwayParams{0.80, 0.05, 3.0};

  agripv::CropSeason s;
  s.harvest_date = Date::from_ymd(2024, 3, 10);
  s.yield_kg_per_ha = 1000.0;
  s.irrigation_m3_per_ha = agripv::DailySeries(2.0);
  c.seasons[Date::from_ymd(2024, 3, 1).days_since_epoch()] = s;

  t.crops["tomato"] = c;
  return t;
}

} // namespace

int test_harvest() {
  using namespace agripv;

  // Stress factor.
  AGRIPV_ASSERT(near(water_stress_factor(50.0, 100.0, 1.0), 0.5));
  AGRIPV_ASSERT(near(water_stress_factor(50.0, 100.0, 1.25), 0.375));
  AGRIPV_ASSERT(water_stress_factor(50.0, 100.0, 2.5) == 0.0);
  AGRIPV_ASSERT(water_stress_factor(150.0, 100.0, 1.25) == 1.0);
  AGRIPV_ASSERT(water_stress_factor(0.0, 0.0, 1.25) == 1.0);

  double prev = -1.0;
  for (int w = 0; w <= 120; w += 5) {
    const double f = water_stress_factor(static_cast<double>(w), 100.0, 1.05);
    AGRIPV_ASSERT(f >= prev);
    prev = f;
  }

  const TableDataProvider data(tomato_tables());

  FarmConfig farm;
  farm.id = "f1";
  farm.area_ha = 20.0;
  farm.yield_factor = 1.1;
  CropPlan plan;
  plan.name = "tomato";
  plan.area_fraction = 0.5;
  plan.percent_planted = 1.0;

  // Planning reads the yield curve and totals the season's water need.
  {
    const auto p = plan_crop_planting(farm, plan, 2024, "03-01", data);
    AGRIPV_ASSERT(p.has_value());
    AGRIPV_ASSERT(near(p->area_ha, 10.0));
    AGRIPV_ASSERT(near(p->expected_yield_kg_per_ha, 1100.0));
    AGRIPV_ASSERT(near(p->expected_total_water_m3, 10.0 * 2.0 * 10.0));
    AGRIPV_ASSERT(p->harvest_date.to_string() == "2024-03-10");
    AGRIPV_ASSERT(p->is_active(Date::from_ymd(2024, 3, 10)));
    AGRIPV_ASSERT(!p->is_active(Date::from_ymd(2024, 3, 11)));

    // No yield curve: cannot plant.
    AGRIPV_ASSERT(!plan_crop_planting(farm, plan, 2024, "04-01", data).has_value());
    CropPlan other = plan;
    other.name = "kale";
    AGRIPV_ASSERT(!plan_crop_planting(farm, other, 2024, "03-01", data).has_value());
  }

  // Harvest with full water and a half fresh / half dried split.
  {
    CropPlanting p;
    p.crop = "tomato";
    p.area_ha = 10.0;
    p.expected_yield_kg_per_ha = 1000.0;
    p.expected_total_water_m3 = 200.0;
    p.cumulative_water_m3 = 200.0;

    ProcessingSplit split;
    split.fresh = 0.5;
    split.dried = 0.5;
    harvest_planting(p, 1.05, 0.5, split, data);

    AGRIPV_ASSERT(p.harvested);
    AGRIPV_ASSERT(p.water_stress_factor == 1.0);
    AGRIPV_ASSERT(near(p.harvest_yield_kg, 10000.0));
    AGRIPV_ASSERT(near(p.fresh_revenue_usd, 4500.0 * 0.5));
    AGRIPV_ASSERT(near(p.processed_revenue_usd, 950.0 * 0.5 * 3.0));
    AGRIPV_ASSERT(near(p.processed_output_kg, 1000.0));
    AGRIPV_ASSERT(near(p.post_harvest_loss_kg, 500.0 + 4050.0));
    AGRIPV_ASSERT(near(p.total_revenue_usd(), 3675.0));
  }

  // Yield never decreases as more water arrives.
  {
    double last = -1.0;
    for (int w = 0; w <= 250; w += 10) {
      CropPlanting p;
      p.crop = "tomato";
      p.area_ha = 10.0;
      p.expected_yield_kg_per_ha = 1000.0;
      p.expected_total_water_m3 = 200.0;
      p.cumulative_water_m3 = static_cast<double>(w);
      harvest_planting(p, 1.05, 0.5, ProcessingSplit{}, data);
      AGRIPV_ASSERT(p.harvest_yield_kg >= last);
      last = p.harvest_yield_kg;
    }
    AGRIPV_ASSERT(near(last, 10000.0));
  }

  // Same-crop seasons that share a day overlap; different crops never do.
  {
    CropPlanting a;
    a.crop = "tomato";
    a.planting_date = Date::from_ymd(2024, 3, 1);
    a.harvest_date = Date::from_ymd(2024, 3, 10);
    CropPlanting b = a;
    b.planting_date = Date::from_ymd(2024, 3, 10);
    b.harvest_date = Date::from_ymd(2024, 3, 20);
    CropPlanting c = b;
    c.crop = "onion";

    AGRIPV_ASSERT(find_planting_overlaps({a, b}).size() == 1);
    AGRIPV_ASSERT(find_planting_overlaps({a, c}).empty());
    b.planting_date = Date::from_ymd(2024, 3, 11);
    AGRIPV_ASSERT(find_planting_overlaps({b, a}).empty());
  }

  return 0;
}
