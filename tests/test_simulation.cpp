#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "agripv/core/aquifer.h"
#include "agripv/core/simulation.h"
#include "agripv/util/json.h"
#include "agripv/util/results_export.h"

#define AGRIPV_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace agripv;

bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

// 90-day tomato season (planted Jan 1, harvested the 90th day): 50 t/ha expected,
// 500 m3/ha of water spread evenly.
constexpr double kDailyM3PerHa = 500.0 / 90.0;

CropSeason tomato_season(Date planting) {
  CropSeason s;
  s.harvest_date = planting.add_days(89);
  s.yield_kg_per_ha = 50000.0;
  s.irrigation_m3_per_ha = DailySeries(kDailyM3PerHa);
  return s;
}

LookupTables base_tables(double pv_kwh_per_kw = 5.0) {
  LookupTables t;
  t.treatment_kwh_per_m3["moderate"] = 1.5;
  t.municipal_water_price[PricingRegime::Subsidized] = DailySeries(0.75);
  t.municipal_water_price[PricingRegime::Unsubsidized] = DailySeries(1.10);
  // Free energy, so groundwater costs exactly its O&M rate.
  t.electricity_price[PricingRegime::Subsidized] = DailySeries(0.0);
  t.electricity_price[PricingRegime::Unsubsidized] = DailySeries(0.20);
  t.diesel_price = DailySeries(1.0);
  t.fertilizer_cost = DailySeries(0.0);
  t.household_energy = DailySeries(0.0);
  t.building_energy = DailySeries(0.0);
  t.household_water = DailySeries(0.0);
  t.building_water = DailySeries(0.0);
  t.pv_kwh_per_kw["medium"] = DailySeries(pv_kwh_per_kw);

  CropTable tomato;
  tomato.ky = 1.05;
  tomato.price_usd_per_kg = DailySeries(0.30);
  for (const char* planting : {"2024-01-01", "2024-02-01", "2025-01-01"}) {
    const Date d = Date::parse_iso_ymd(planting);
    tomato.seasons[d.days_since_epoch()] = tomato_season(d);
  }
  t.crops["tomato"] = tomato;
  return t;
}

std::shared_ptr<const TableDataProvider> make_data(double pv_kwh_per_kw = 5.0) {
  return std::make_shared<const TableDataProvider>(base_tables(pv_kwh_per_kw));
}

// Groundwater kWh/m3 with no drawdown: lift and friction, conveyance, moderate treatment.
double base_groundwater_kwh_per_m3(const Scenario& sc) {
  return pumping_energy(sc.wells, sc.wells.well_depth_m).total_kwh_per_m3() + 0.2 + 1.5;
}

Scenario one_farm(const std::string& water_policy, const std::string& end = "2024-03-30") {
  Scenario sc;
  sc.name = "tomato " + water_policy;
  sc.start_date = Date::parse_iso_ymd("2024-01-01");
  sc.end_date = Date::parse_iso_ymd(end);
  // Plenty of well and treatment capacity.
  sc.wells.number_of_wells = 100;
  sc.wells.well_flow_rate_m3_day = 100.0;
  sc.treatment.capacity_m3_day = 10000.0;

  FarmConfig f;
  f.id = "f1";
  f.area_ha = 10.0;
  f.water_policy = water_policy;
  CropPlan c;
  c.name = "tomato";
  c.planting_dates = {"01-01"};
  f.crops.push_back(c);
  sc.farms.push_back(f);
  return sc;
}

SimConfig e2e_config() {
  SimConfig cfg;
  cfg.gw_maintenance_usd_per_m3 = 0.30;
  return cfg;
}

template <typename Fn>
bool throws_invalid(Fn fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

} // namespace

int test_simulation() {
  // Single farm on groundwater: full water, no stress, cost = volume x unit cost.
  {
    Simulation sim(one_farm("always_groundwater"), make_data(), e2e_config());
    const SimulationState& st = sim.run();
    AGRIPV_ASSERT(sim.finished());
    AGRIPV_ASSERT(sim.finalized());
    AGRIPV_ASSERT(st.days_simulated == 90);
    AGRIPV_ASSERT(st.yearly_farm_metrics.size() == 1);

    const YearlyFarmMetrics& m = st.yearly_farm_metrics[0];
    AGRIPV_ASSERT(m.year == 2024);
    AGRIPV_ASSERT(m.totals.municipal_m3 == 0.0);
    AGRIPV_ASSERT(near(m.totals.groundwater_m3, 5000.0));
    AGRIPV_ASSERT(near(m.totals.water_cost_usd, 5000.0 * 0.30));
    AGRIPV_ASSERT(near(m.totals.yield_kg, 500000.0, 1e-3));
    AGRIPV_ASSERT(near(m.self_sufficiency_pct, 100.0));
    AGRIPV_ASSERT(near(m.crops.at("tomato").water_m3, 5000.0));

    const CropPlanting& p = st.farms[0].plantings.at(0);
    AGRIPV_ASSERT(p.harvested);
    AGRIPV_ASSERT(near(p.water_stress_factor, 1.0, 1e-9));
    AGRIPV_ASSERT(near(p.harvest_yield_kg, 500000.0, 1e-3));
    AGRIPV_ASSERT(near(st.aquifer.cumulative_extraction_m3(), 5000.0));

    for (const DailyWaterRecord& r : st.farms[0].daily_water) {
      AGRIPV_ASSERT(near(r.delivered_m3(), r.demand_m3, 1e-9));
      AGRIPV_ASSERT(r.decision_reason == "gw_preferred");
    }
    AGRIPV_ASSERT(st.farms[0].daily_water.size() == 90);

    // Revenue: all fresh at $0.30/kg with no recorded losses.
    AGRIPV_ASSERT(near(m.totals.crop_revenue_usd, 150000.0, 1e-3));
    AGRIPV_ASSERT(st.economics.years_rolled == 1);
    AGRIPV_ASSERT(near(st.economics.total_revenue_usd, 150000.0, 1e-3));

    bool threw = false;
    try {
      sim.step_day();
    } catch (const std::logic_error&) {
      threw = true;
    }
    AGRIPV_ASSERT(threw);
  }

  // Same demand on municipal water: no pumping energy, nothing drawn from the aquifer.
  {
    const SimulationState st = run_simulation(one_farm("always_municipal"), make_data(), e2e_config());
    const YearlyFarmMetrics& m = st.yearly_farm_metrics[0];
    AGRIPV_ASSERT(m.totals.groundwater_m3 == 0.0);
    AGRIPV_ASSERT(m.totals.energy_kwh == 0.0);
    AGRIPV_ASSERT(near(m.totals.municipal_m3, 5000.0));
    AGRIPV_ASSERT(near(m.totals.water_cost_usd, 5000.0 * 0.75));
    AGRIPV_ASSERT(st.aquifer.cumulative_extraction_m3() == 0.0);
    AGRIPV_ASSERT(st.yearly_energy_metrics[0].totals.demand_kwh == 0.0);
    AGRIPV_ASSERT(near(st.yearly_farm_metrics[0].totals.yield_kg, 500000.0, 1e-3));
  }

  // Stepping by hand; finalize is refused before the horizon ends.
  {
    Simulation sim(one_farm("cheapest_source"), make_data(), e2e_config());
    AGRIPV_ASSERT(sim.advance_days(10) == 10);
    AGRIPV_ASSERT(sim.state().current_date.to_string() == "2024-01-11");
    bool threw = false;
    try {
      sim.finalize();
    } catch (const std::logic_error&) {
      threw = true;
    }
    AGRIPV_ASSERT(threw);
    AGRIPV_ASSERT(sim.advance_days(1000) == 80);
    sim.finalize();
    sim.finalize();  // no-op
    AGRIPV_ASSERT(sim.state().yearly_farm_metrics.size() == 1);
  }

  // Configuration errors stop the run before day one.
  {
    const Scenario bad_policy = one_farm("desalinate_everything");
    const bool rejected_policy = throws_invalid([&] { Simulation sim(bad_policy, make_data()); });
    AGRIPV_ASSERT(rejected_policy);

    // Two 90-day tomato seasons a month apart on the same farm.
    Scenario overlap = one_farm("always_groundwater");
    overlap.farms[0].crops[0].planting_dates.push_back("02-01");
    const bool rejected_overlap = throws_invalid([&] { Simulation sim(overlap, make_data()); });
    AGRIPV_ASSERT(rejected_overlap);

    const bool rejected_no_data = throws_invalid([] { Simulation sim(one_farm("always_groundwater"), nullptr); });
    AGRIPV_ASSERT(rejected_no_data);
  }

  // A season without a yield curve is skipped, or refused in strict mode.
  {
    Scenario sc = one_farm("always_groundwater");
    sc.farms[0].crops[0].planting_dates.push_back("06-01");
    sc.end_date = Date::parse_iso_ymd("2024-06-30");
    Simulation sim(sc, make_data(), e2e_config());
    AGRIPV_ASSERT(sim.state().skipped_plantings.size() == 1);
    AGRIPV_ASSERT(sim.state().skipped_plantings[0] == "f1/tomato@2024-06-01");
    AGRIPV_ASSERT(sim.state().farms[0].plantings.size() == 1);

    SimConfig strict = e2e_config();
    strict.strict_plantings = true;
    const bool rejected_strict = throws_invalid([&] { Simulation s2(sc, make_data(), strict); });
    AGRIPV_ASSERT(rejected_strict);
  }

  // Two years: farm totals restart each January, the aquifer and battery carry over.
  {
    Scenario sc = one_farm("always_groundwater", "2025-12-31");
    sc.pv.sys_capacity_kw = 20.0;
    sc.battery.capacity_kwh = 50.0;
    Simulation sim(sc, make_data(), e2e_config());
    const SimulationState& st = sim.run();

    AGRIPV_ASSERT(st.days_simulated == 731);
    AGRIPV_ASSERT(st.yearly_farm_metrics.size() == 2);
    AGRIPV_ASSERT(st.yearly_energy_metrics.size() == 2);
    AGRIPV_ASSERT(st.yearly_farm_metrics[1].year == 2025);
    AGRIPV_ASSERT(st.economics.years_rolled == 2);
    AGRIPV_ASSERT(st.farms[0].plantings.size() == 2);

    const double gw_2024 = st.yearly_farm_metrics[0].totals.groundwater_m3;
    const double gw_2025 = st.yearly_farm_metrics[1].totals.groundwater_m3;
    AGRIPV_ASSERT(gw_2024 > 0.0);
    AGRIPV_ASSERT(gw_2025 > 0.0);
    AGRIPV_ASSERT(near(st.aquifer.cumulative_extraction_m3(), gw_2024 + gw_2025));

    double demand_2025 = 0.0;
    for (const DailyEnergyRecord& r : st.energy.daily_records) {
      AGRIPV_ASSERT(r.soc_after >= sc.battery.soc_min - 1e-12);
      AGRIPV_ASSERT(r.soc_after <= sc.battery.soc_max + 1e-12);
      if (r.date.year() == 2025) demand_2025 += r.demand_kwh;
    }
    AGRIPV_ASSERT(near(st.yearly_energy_metrics[1].totals.demand_kwh, demand_2025));
    AGRIPV_ASSERT(st.energy.daily_records.size() == 731);
    AGRIPV_ASSERT(st.yearly_energy_metrics[1].totals.pv_kwh > 0.0);
    // One day fewer and a year of panel degradation.
    AGRIPV_ASSERT(st.yearly_energy_metrics[1].totals.pv_kwh < st.yearly_energy_metrics[0].totals.pv_kwh);
  }

  // Weak PV caps how much groundwater can be pumped.
  {
    Scenario sc = one_farm("always_groundwater");
    sc.pv.sys_capacity_kw = 1.0;
    Simulation sim(sc, make_data(0.5), e2e_config());
    const SimulationState& st = sim.run();
    const YearlyFarmMetrics& m = st.yearly_farm_metrics[0];
    AGRIPV_ASSERT(m.totals.municipal_m3 > 0.0);
    AGRIPV_ASSERT(m.totals.groundwater_m3 > 0.0);
    AGRIPV_ASSERT(near(m.totals.groundwater_m3 + m.totals.municipal_m3, 5000.0));
    const DailyWaterRecord& r = st.farms[0].daily_water.front();
    AGRIPV_ASSERT(r.decision_reason == "gw_preferred_but_energy_limit");
    AGRIPV_ASSERT(r.energy_kwh <= 0.5 * 0.90 + 1e-9);
    // The shortfall was delivered from municipal supply, so the crop is unstressed.
    AGRIPV_ASSERT(near(m.totals.yield_kg, 500000.0, 1e-3));
  }

  // Annual quota holds over the season.
  {
    Scenario sc = one_farm("quota_enforced");
    sc.farms[0].water_policy_params.annual_quota_m3 = 6000.0;
    const SimulationState st = run_simulation(sc, make_data(), e2e_config());
    const YearlyFarmMetrics& m = st.yearly_farm_metrics[0];
    // 6000/12 x 1.15 = 575 m3 a month against ~1700 m3 of monthly demand.
    AGRIPV_ASSERT(m.totals.groundwater_m3 <= 3 * 575.0 + 1e-6);
    AGRIPV_ASSERT(near(m.totals.groundwater_m3, 3 * 575.0));
    AGRIPV_ASSERT(near(m.totals.groundwater_m3 + m.totals.municipal_m3, 5000.0));
  }

  // Well capacity is shared in proportion to farm area.
  {
    Scenario sc = one_farm("always_groundwater");
    sc.wells.number_of_wells = 1;
    sc.wells.well_flow_rate_m3_day = 40.0;
    FarmConfig small = sc.farms[0];
    small.id = "f2";
    sc.farms[0].area_ha = 30.0;
    sc.farms.push_back(small);
    const SimulationState st = run_simulation(sc, make_data(), e2e_config());

    for (const DailyWaterRecord& r : st.farms[0].daily_water) {
      AGRIPV_ASSERT(near(r.groundwater_m3, 30.0));
      AGRIPV_ASSERT(r.decision_reason == "gw_preferred_but_well_limit");
    }
    for (const DailyWaterRecord& r : st.farms[1].daily_water) {
      AGRIPV_ASSERT(near(r.groundwater_m3, 10.0));
      AGRIPV_ASSERT(near(r.delivered_m3(), r.demand_m3, 1e-9));
    }
  }

  // Tiered municipal billing restarts every month.
  {
    Scenario sc = one_farm("always_municipal");
    TierPricing tiers;
    tiers.brackets.push_back({0.0, 1000.0, 0.5});
    tiers.brackets.push_back({1000.0, std::numeric_limits<double>::infinity(), 1.0});
    sc.pricing.agricultural_water_tiers = tiers;
    const SimulationState st = run_simulation(sc, make_data(), e2e_config());

    // Each of the three months passes 1000 m3: 3 x 500 at the first rate plus the
    // remaining 2000 m3 at the second.
    AGRIPV_ASSERT(near(st.yearly_farm_metrics[0].totals.water_cost_usd, 3500.0, 1e-6));
    const auto& days = st.farms[0].daily_water;
    AGRIPV_ASSERT(days.front().water_tier == 1);
    AGRIPV_ASSERT(days[30].water_tier == 2);  // Jan 31
    AGRIPV_ASSERT(days[31].water_tier == 1);  // Feb 1
  }

  // Drawdown: as the aquifer empties, each m3 takes more energy and costs more.
  {
    Scenario sc = one_farm("always_groundwater");
    sc.aquifer.exploitable_volume_m3 = 50000.0;
    sc.aquifer.max_drawdown_m = 100.0;
    sc.pricing.agricultural_energy = PricingRegime::Unsubsidized;
    const SimulationState st = run_simulation(sc, make_data(), e2e_config());

    const auto& days = st.farms[0].daily_water;
    AGRIPV_ASSERT(days.size() == 90);
    const DailyWaterRecord& first = days.front();
    const DailyWaterRecord& last = days.back();
    AGRIPV_ASSERT(first.groundwater_m3 > 0.0);
    AGRIPV_ASSERT(last.groundwater_m3 > 0.0);
    AGRIPV_ASSERT(near(first.energy_kwh / first.groundwater_m3, base_groundwater_kwh_per_m3(sc), 1e-9));
    AGRIPV_ASSERT(last.energy_kwh / last.groundwater_m3 > first.energy_kwh / first.groundwater_m3);
    AGRIPV_ASSERT(last.gw_cost_per_m3 > first.gw_cost_per_m3);
    // About 5000 of 50000 m3 drawn: roughly a tenth of the maximum drawdown.
    AGRIPV_ASSERT(st.aquifer.drawdown_m() > 9.0);
    AGRIPV_ASSERT(st.aquifer.drawdown_m() < 10.0 + 1e-9);
  }

  // Domestic demand end to end: drawn from the aquifer, pumped and treated, billed at
  // the domestic tariffs.
  {
    LookupTables t = base_tables();
    t.household_water = DailySeries(20.0);
    t.building_water = DailySeries(5.0);
    t.household_energy = DailySeries(100.0);
    t.building_energy = DailySeries(30.0);
    Scenario sc = one_farm("always_municipal");
    sc.pricing.domestic_energy = PricingRegime::Unsubsidized;
    const SimulationState st =
        run_simulation(sc, std::make_shared<const TableDataProvider>(std::move(t)), e2e_config());

    AGRIPV_ASSERT(near(st.aquifer.cumulative_extraction_m3(), 25.0 * 90));
    AGRIPV_ASSERT(near(st.community.household_water_m3, 20.0 * 90));
    AGRIPV_ASSERT(near(st.community.building_energy_kwh, 30.0 * 90));

    const double gw_kwh_per_m3 = base_groundwater_kwh_per_m3(sc);
    AGRIPV_ASSERT(st.energy.daily_records.size() == 90);
    for (const DailyEnergyRecord& r : st.energy.daily_records) {
      AGRIPV_ASSERT(near(r.demand_kwh, 130.0 + 25.0 * gw_kwh_per_m3, 1e-9));
    }

    AGRIPV_ASSERT(near(st.community.domestic_water_cost_usd, 25.0 * 90 * 0.75));
    AGRIPV_ASSERT(near(st.community.domestic_energy_cost_usd, 130.0 * 90 * 0.20));
    const double farm_water_cost = st.yearly_farm_metrics[0].totals.water_cost_usd;
    AGRIPV_ASSERT(near(farm_water_cost, 5000.0 * 0.75));
    AGRIPV_ASSERT(near(st.economics.total_operating_cost_usd,
                       st.community.domestic_water_cost_usd + st.community.domestic_energy_cost_usd +
                           farm_water_cost + st.economics.annual_infrastructure_cost_usd));
  }

  // Domestic water pumping and household load are served from renewables before farms.
  {
    Scenario sc = one_farm("always_groundwater");
    sc.pv.sys_capacity_kw = 1.0;
    const double gw_kwh_per_m3 = base_groundwater_kwh_per_m3(sc);
    LookupTables t = base_tables(0.5);
    t.household_water = DailySeries(0.15 / gw_kwh_per_m3);
    t.household_energy = DailySeries(0.05);
    const SimulationState st =
        run_simulation(sc, std::make_shared<const TableDataProvider>(std::move(t)), e2e_config());

    const double renewables = st.energy.daily_records.front().renewable_kwh();
    AGRIPV_ASSERT(renewables > 0.2);
    const DailyWaterRecord& r = st.farms[0].daily_water.front();
    AGRIPV_ASSERT(r.decision_reason == "gw_preferred_but_energy_limit");
    AGRIPV_ASSERT(near(r.energy_kwh, renewables - 0.15 - 0.05, 1e-9));
    AGRIPV_ASSERT(near(st.energy.daily_records.front().demand_kwh, renewables, 1e-9));
  }

  // Feb 29 plantings are refused when the horizon reaches a non-leap year.
  {
    Scenario sc = one_farm("always_groundwater", "2025-12-31");
    sc.farms[0].crops[0].planting_dates = {"02-29"};
    std::string message;
    try {
      Simulation sim(sc, make_data());
    } catch (const std::invalid_argument& e) {
      message = e.what();
    }
    AGRIPV_ASSERT(message.find("planting date '02-29' in 2025") != std::string::npos);
  }

  // One description line per farm.
  {
    Scenario sc = one_farm("always_groundwater");
    FarmConfig other = sc.farms[0];
    other.id = "f2";
    other.water_policy = "quota_enforced";
    other.water_policy_params.annual_quota_m3 = 1200.0;
    sc.farms.push_back(other);
    Simulation sim(sc, make_data(), e2e_config());
    const std::vector<std::string> lines = sim.describe_policies();
    AGRIPV_ASSERT(lines.size() == 2);
    AGRIPV_ASSERT(lines[0].rfind("f1: always_groundwater:", 0) == 0);
    AGRIPV_ASSERT(lines[1].rfind("f2: quota_enforced: 1200 m3/year", 0) == 0);
    AGRIPV_ASSERT(lines[1].find("food ") != std::string::npos);
  }

  // Results export.
  {
    Simulation sim(one_farm("always_groundwater"), make_data(), e2e_config());
    sim.run();
    const std::string text = results_to_json(sim, true);
    AGRIPV_ASSERT(!text.empty() && text.back() == '\n');

    const json::Value doc = json::parse(text);
    AGRIPV_ASSERT(doc.at("scenario").string_value() == "tomato always_groundwater");
    AGRIPV_ASSERT(doc.at("days_simulated").int_value() == 90);
    AGRIPV_ASSERT(doc.at("yearly_farm_metrics").array().size() == 1);
    AGRIPV_ASSERT(near(doc.at("yearly_farm_metrics").at(0).at("groundwater_m3").number_value(), 5000.0, 1e-3));
    AGRIPV_ASSERT(doc.at("economics").at("subsystems").array().size() == kSubsystemCount);
    AGRIPV_ASSERT(doc.at("farms").at(0).at("daily_water").array().size() == 90);
    AGRIPV_ASSERT(doc.at("daily_energy").array().size() == 90);
    AGRIPV_ASSERT(near(doc.at("aquifer").at("cumulative_extraction_m3").number_value(), 5000.0, 1e-3));

    const std::string csv = daily_water_to_csv(sim.state());
    AGRIPV_ASSERT(csv.rfind("date,farm_id,demand_m3", 0) == 0);
    AGRIPV_ASSERT(csv.find("2024-03-30,f1,") != std::string::npos);
    AGRIPV_ASSERT(daily_energy_to_csv(sim.state()).rfind("date,demand_kwh", 0) == 0);
    AGRIPV_ASSERT(yearly_farm_metrics_to_csv(sim.state()).find("\n2024,f1,") != std::string::npos);
  }

  return 0;
}
