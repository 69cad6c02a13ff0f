#include "agripv/util/results_export.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "agripv/util/json.h"
#include "agripv/util/strings.h"

namespace agripv {
namespace {

std::string num(double v) { return format_fixed(v, 4); }

json::Value farm_year_to_json(const YearlyFarmMetrics& m) {
  json::Object o;
  o["year"] = static_cast<double>(m.year);
  o["farm_id"] = m.farm_id;
  o["farm_name"] = m.farm_name;
  o["groundwater_m3"] = m.totals.groundwater_m3;
  o["municipal_m3"] = m.totals.municipal_m3;
  o["total_water_m3"] = m.totals.total_water_m3();
  o["water_cost_usd"] = m.totals.water_cost_usd;
  o["energy_kwh"] = m.totals.energy_kwh;
  o["yield_kg"] = m.totals.yield_kg;
  o["crop_revenue_usd"] = m.totals.crop_revenue_usd;
  o["fresh_revenue_usd"] = m.totals.fresh_revenue_usd;
  o["processed_revenue_usd"] = m.totals.processed_revenue_usd;
  o["processed_output_kg"] = m.totals.processed_output_kg;
  o["post_harvest_loss_kg"] = m.totals.post_harvest_loss_kg;
  o["fertilizer_cost_usd"] = m.totals.fertilizer_cost_usd;
  o["water_per_yield_m3_per_kg"] = m.water_per_yield_m3_per_kg;
  o["water_cost_per_m3"] = m.water_cost_per_m3;
  o["self_sufficiency_pct"] = m.self_sufficiency_pct;

  json::Object crops;
  for (const auto& [name, c] : m.crops) {
    json::Object co;
    co["water_m3"] = c.water_m3;
    co["yield_kg"] = c.yield_kg;
    co["revenue_usd"] = c.revenue_usd;
    crops[name] = json::object(std::move(co));
  }
  o["crops"] = json::object(std::move(crops));
  return json::object(std::move(o));
}

json::Value energy_year_to_json(const YearlyEnergyMetrics& m) {
  const EnergyYearTotals& t = m.totals;
  json::Object o;
  o["year"] = static_cast<double>(m.year);
  o["demand_kwh"] = t.demand_kwh;
  o["pv_kwh"] = t.pv_kwh;
  o["wind_kwh"] = t.wind_kwh;
  o["grid_import_kwh"] = t.grid_import_kwh;
  o["grid_export_kwh"] = t.grid_export_kwh;
  o["generator_kwh"] = t.generator_kwh;
  o["generator_fuel_l"] = t.generator_fuel_l;
  o["battery_charge_kwh"] = t.battery_charge_kwh;
  o["battery_discharge_kwh"] = t.battery_discharge_kwh;
  o["curtailed_kwh"] = t.curtailed_kwh;
  o["unmet_kwh"] = t.unmet_kwh;
  o["soc_end"] = m.soc_end;
  o["self_sufficiency_pct"] = m.self_sufficiency_pct;
  return json::object(std::move(o));
}

json::Value economics_to_json(const EconomicState& e) {
  json::Object o;
  o["cash_reserves_usd"] = e.cash_reserves_usd;
  o["total_revenue_usd"] = e.total_revenue_usd;
  o["total_operating_cost_usd"] = e.total_operating_cost_usd;
  o["total_infrastructure_cost_usd"] = e.total_infrastructure_cost_usd;
  o["total_debt_service_usd"] = e.total_debt_service_usd;
  o["annual_infrastructure_cost_usd"] = e.annual_infrastructure_cost_usd;
  o["annual_debt_service_usd"] = e.annual_debt_service_usd;
  o["years_rolled"] = static_cast<double>(e.years_rolled);

  json::Array subs;
  subs.reserve(e.subsystems.size());
  for (const SubsystemCost& c : e.subsystems) {
    json::Object so;
    so["subsystem"] = std::string(subsystem_id(c.subsystem));
    so["financing"] = std::string(financing_status_id(c.status));
    so["capital_usd"] = c.capital_usd;
    so["annual_om_usd"] = c.annual_om_usd;
    so["annual_capex_usd"] = c.annual_capex_usd;
    so["annual_debt_service_usd"] = c.annual_debt_service_usd;
    so["annual_opex_usd"] = c.annual_opex_usd;
    so["annual_total_usd"] = c.annual_total_usd();
    subs.push_back(json::object(std::move(so)));
  }
  o["subsystems"] = json::array(std::move(subs));
  return json::object(std::move(o));
}

json::Value community_to_json(const CommunityTotals& c) {
  json::Object o;
  o["household_water_m3"] = c.household_water_m3;
  o["building_water_m3"] = c.building_water_m3;
  o["household_energy_kwh"] = c.household_energy_kwh;
  o["building_energy_kwh"] = c.building_energy_kwh;
  o["domestic_water_cost_usd"] = c.domestic_water_cost_usd;
  o["domestic_energy_cost_usd"] = c.domestic_energy_cost_usd;
  o["diesel_cost_usd"] = c.diesel_cost_usd;
  o["fertilizer_cost_usd"] = c.fertilizer_cost_usd;
  return json::object(std::move(o));
}

json::Value plantings_to_json(const FarmState& farm) {
  json::Array out;
  out.reserve(farm.plantings.size());
  for (const CropPlanting& p : farm.plantings) {
    json::Object o;
    o["crop"] = p.crop;
    o["planting_date"] = p.planting_date.to_string();
    o["harvest_date"] = p.harvest_date.to_string();
    o["area_ha"] = p.area_ha;
    o["harvested"] = p.harvested;
    o["expected_total_water_m3"] = p.expected_total_water_m3;
    o["cumulative_water_m3"] = p.cumulative_water_m3;
    o["water_stress_factor"] = p.water_stress_factor;
    o["harvest_yield_kg"] = p.harvest_yield_kg;
    o["total_revenue_usd"] = p.total_revenue_usd();
    out.push_back(json::object(std::move(o)));
  }
  return json::array(std::move(out));
}

json::Value daily_water_to_json(const FarmState& farm) {
  json::Array out;
  out.reserve(farm.daily_water.size());
  for (const DailyWaterRecord& r : farm.daily_water) {
    json::Object o;
    o["date"] = r.date.to_string();
    o["demand_m3"] = r.demand_m3;
    o["groundwater_m3"] = r.groundwater_m3;
    o["municipal_m3"] = r.municipal_m3;
    o["energy_kwh"] = r.energy_kwh;
    o["cost_usd"] = r.cost_usd;
    o["decision_reason"] = r.decision_reason;
    if (!r.limiting_factor.empty()) o["limiting_factor"] = r.limiting_factor;
    if (r.water_tier > 0) {
      o["water_tier"] = static_cast<double>(r.water_tier);
      o["tier_effective_rate"] = r.tier_effective_rate;
    }
    out.push_back(json::object(std::move(o)));
  }
  return json::array(std::move(out));
}

json::Value daily_energy_to_json(const EnergyState& s) {
  json::Array out;
  out.reserve(s.daily_records.size());
  for (const DailyEnergyRecord& r : s.daily_records) {
    json::Object o;
    o["date"] = r.date.to_string();
    o["demand_kwh"] = r.demand_kwh;
    o["pv_kwh"] = r.pv_kwh;
    o["wind_kwh"] = r.wind_kwh;
    o["battery_charge_kwh"] = r.battery_charge_kwh;
    o["battery_discharge_kwh"] = r.battery_discharge_kwh;
    o["soc"] = r.soc_after;
    o["grid_import_kwh"] = r.grid_import_kwh;
    o["grid_export_kwh"] = r.grid_export_kwh;
    o["generator_kwh"] = r.generator_kwh;
    o["generator_fuel_l"] = r.generator_fuel_l;
    o["curtailed_kwh"] = r.curtailed_kwh;
    o["unmet_kwh"] = r.unmet_kwh;
    out.push_back(json::object(std::move(o)));
  }
  return json::array(std::move(out));
}

json::Value daily_storage_to_json(const WaterStorageState& s) {
  json::Array out;
  out.reserve(s.daily_records().size());
  for (const DailyStorageRecord& r : s.daily_records()) {
    json::Object o;
    o["date"] = r.date.to_string();
    o["level_m3"] = r.level_m3;
    o["inflow_m3"] = r.inflow_m3;
    o["outflow_m3"] = r.outflow_m3;
    o["utilization_pct"] = r.utilization_pct;
    out.push_back(json::object(std::move(o)));
  }
  return json::array(std::move(out));
}

} // namespace

std::string results_to_json(const Simulation& sim, bool include_daily) {
  const SimulationState& st = sim.state();
  const Scenario& sc = sim.scenario();

  json::Object root;
  root["scenario"] = sc.name;
  root["start_date"] = sc.start_date.to_string();
  root["end_date"] = sc.end_date.to_string();
  root["days_simulated"] = static_cast<double>(st.days_simulated);
  root["finalized"] = sim.finalized();

  json::Array farm_years;
  farm_years.reserve(st.yearly_farm_metrics.size());
  for (const auto& m : st.yearly_farm_metrics) farm_years.push_back(farm_year_to_json(m));
  root["yearly_farm_metrics"] = json::array(std::move(farm_years));

  json::Array energy_years;
  energy_years.reserve(st.yearly_energy_metrics.size());
  for (const auto& m : st.yearly_energy_metrics) energy_years.push_back(energy_year_to_json(m));
  root["yearly_energy_metrics"] = json::array(std::move(energy_years));

  root["economics"] = economics_to_json(st.economics);
  root["community"] = community_to_json(st.community);

  json::Object aquifer;
  const double years = st.years_elapsed();
  aquifer["cumulative_extraction_m3"] = st.aquifer.cumulative_extraction_m3();
  aquifer["net_depletion_m3"] = st.aquifer.net_depletion_m3(years);
  aquifer["years_remaining"] = st.aquifer.years_remaining(years);  // inf serializes as null
  aquifer["drawdown_m"] = st.aquifer.drawdown_m();
  root["aquifer"] = json::object(std::move(aquifer));

  json::Object storage;
  storage["capacity_m3"] = st.storage.capacity_m3();
  storage["level_m3"] = st.storage.level_m3();
  storage["utilization_pct"] = st.storage.utilization_pct();
  root["storage"] = json::object(std::move(storage));

  json::Array skipped;
  for (const auto& s : st.skipped_plantings) skipped.push_back(s);
  root["skipped_plantings"] = json::array(std::move(skipped));

  json::Array farms;
  for (const FarmState& f : st.farms) {
    json::Object fo;
    fo["id"] = f.id;
    fo["name"] = f.name;
    fo["area_ha"] = f.area_ha;
    fo["water_policy"] = f.water_policy;
    fo["food_policy"] = f.food_policy;
    fo["plantings"] = plantings_to_json(f);
    if (include_daily) fo["daily_water"] = daily_water_to_json(f);
    farms.push_back(json::object(std::move(fo)));
  }
  root["farms"] = json::array(std::move(farms));

  if (include_daily) {
    root["daily_energy"] = daily_energy_to_json(st.energy);
    root["daily_storage"] = daily_storage_to_json(st.storage);
  }

  std::string out = json::stringify(json::object(std::move(root)), 2);
  out.push_back('\n');
  return out;
}

std::string daily_water_to_csv(const SimulationState& state) {
  std::string csv =
      "date,farm_id,demand_m3,groundwater_m3,municipal_m3,energy_kwh,cost_usd,decision_reason,limiting_factor,"
      "water_tier,tier_effective_rate\n";

  // Rows are emitted in date order, farms in scenario order within a day.
  std::vector<const DailyWaterRecord*> rows;
  for (const FarmState& f : state.farms) {
    for (const DailyWaterRecord& r : f.daily_water) rows.push_back(&r);
  }
  std::stable_sort(rows.begin(), rows.end(),
                   [](const DailyWaterRecord* a, const DailyWaterRecord* b) { return a->date < b->date; });

  for (const DailyWaterRecord* r : rows) {
    csv += r->date.to_string();
    csv += ",";
    csv += csv_escape(r->farm_id);
    csv += ",";
    csv += num(r->demand_m3);
    csv += ",";
    csv += num(r->groundwater_m3);
    csv += ",";
    csv += num(r->municipal_m3);
    csv += ",";
    csv += num(r->energy_kwh);
    csv += ",";
    csv += num(r->cost_usd);
    csv += ",";
    csv += csv_escape(r->decision_reason);
    csv += ",";
    csv += csv_escape(r->limiting_factor);
    csv += ",";
    csv += std::to_string(r->water_tier);
    csv += ",";
    csv += num(r->tier_effective_rate);
    csv += "\n";
  }
  return csv;
}

std::string daily_energy_to_csv(const SimulationState& state) {
  std::string csv =
      "date,demand_kwh,pv_kwh,wind_kwh,battery_charge_kwh,battery_discharge_kwh,soc,grid_import_kwh,"
      "grid_export_kwh,generator_kwh,generator_fuel_l,curtailed_kwh,unmet_kwh\n";
  for (const DailyEnergyRecord& r : state.energy.daily_records) {
    const std::vector<std::string> cells = {
        r.date.to_string(),         num(r.demand_kwh),      num(r.pv_kwh),          num(r.wind_kwh),
        num(r.battery_charge_kwh),  num(r.battery_discharge_kwh), num(r.soc_after), num(r.grid_import_kwh),
        num(r.grid_export_kwh),     num(r.generator_kwh),   num(r.generator_fuel_l), num(r.curtailed_kwh),
        num(r.unmet_kwh),
    };
    csv += join(cells, ",");
    csv += "\n";
  }
  return csv;
}

std::string yearly_farm_metrics_to_csv(const SimulationState& state) {
  std::string csv =
      "year,farm_id,groundwater_m3,municipal_m3,water_cost_usd,energy_kwh,yield_kg,crop_revenue_usd,"
      "water_per_yield_m3_per_kg,water_cost_per_m3,self_sufficiency_pct\n";
  for (const YearlyFarmMetrics& m : state.yearly_farm_metrics) {
    const std::vector<std::string> cells = {
        std::to_string(m.year),
        csv_escape(m.farm_id),
        num(m.totals.groundwater_m3),
        num(m.totals.municipal_m3),
        num(m.totals.water_cost_usd),
        num(m.totals.energy_kwh),
        num(m.totals.yield_kg),
        num(m.totals.crop_revenue_usd),
        num(m.water_per_yield_m3_per_kg),
        num(m.water_cost_per_m3),
        num(m.self_sufficiency_pct),
    };
    csv += join(cells, ",");
    csv += "\n";
  }
  return csv;
}

} // namespace agripv
