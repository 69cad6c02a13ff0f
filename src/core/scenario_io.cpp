#include "agripv/core/scenario_io.h"

#include <limits>
#include <stdexcept>

#include "agripv/core/food_policy.h"
#include "agripv/core/water_policy.h"
#include "agripv/util/file_io.h"
#include "agripv/util/json.h"

namespace agripv {
namespace {

using json::Value;

[[noreturn]] void bad(const std::string& path, const std::string& what) {
  throw std::invalid_argument(path + ": " + what);
}

const Value* member(const Value& obj, const std::string& key, const std::string& path) {
  if (!obj.is_object()) bad(path, "expected an object");
  return obj.find(key);
}

double read_number(const Value& obj, const std::string& key, double def, const std::string& path) {
  const Value* v = member(obj, key, path);
  if (!v || v->is_null()) return def;
  if (!v->is_number()) bad(path + "." + key, "expected a number");
  return *v->as_number();
}

int read_int(const Value& obj, const std::string& key, int def, const std::string& path) {
  const double d = read_number(obj, key, static_cast<double>(def), path);
  if (!(d >= static_cast<double>(std::numeric_limits<int>::min()) &&
        d <= static_cast<double>(std::numeric_limits<int>::max()))) {
    bad(path + "." + key, "integer out of range");
  }
  if (d != static_cast<double>(static_cast<int>(d))) bad(path + "." + key, "expected an integer");
  return static_cast<int>(d);
}

bool read_bool(const Value& obj, const std::string& key, bool def, const std::string& path) {
  const Value* v = member(obj, key, path);
  if (!v || v->is_null()) return def;
  if (!v->is_bool()) bad(path + "." + key, "expected true or false");
  return *v->as_bool();
}

std::string read_string(const Value& obj, const std::string& key, const std::string& def, const std::string& path) {
  const Value* v = member(obj, key, path);
  if (!v || v->is_null()) return def;
  if (!v->is_string()) bad(path + "." + key, "expected a string");
  return *v->as_string();
}

Date read_date(const Value& obj, const std::string& key, const std::string& path) {
  const Value* v = member(obj, key, path);
  if (!v || !v->is_string()) bad(path + "." + key, "expected a YYYY-MM-DD date");
  try {
    return Date::parse_iso_ymd(*v->as_string());
  } catch (const std::invalid_argument& e) {
    bad(path + "." + key, e.what());
  }
}

const Value& section(const Value& obj, const std::string& key, const std::string& path) {
  static const Value kEmpty = json::object({});
  const Value* v = member(obj, key, path);
  if (!v || v->is_null()) return kEmpty;
  if (!v->is_object()) bad(path + "." + key, "expected an object");
  return *v;
}

// --- scenario ---

PricingRegime read_regime(const Value& obj, const std::string& key, const std::string& path) {
  const std::string s = read_string(obj, key, "subsidized", path);
  PricingRegime r;
  if (!pricing_regime_from_string(s, &r)) bad(path + "." + key, "unknown pricing regime '" + s + "'");
  return r;
}

ProcessingSplit read_split(const Value& v, const std::string& path) {
  if (!v.is_object()) bad(path, "expected an object");
  ProcessingSplit s;
  s.fresh = read_number(v, "fresh", 0.0, path);
  s.packaged = read_number(v, "packaged", 0.0, path);
  s.canned = read_number(v, "canned", 0.0, path);
  s.dried = read_number(v, "dried", 0.0, path);
  return s;
}

void read_water_policy(const Value& farm, FarmConfig& f, const std::string& path) {
  const Value* v = member(farm, "water_policy", path);
  if (!v || v->is_null()) return;
  const std::string p = path + ".water_policy";
  if (v->is_string()) {
    f.water_policy = *v->as_string();
  } else if (v->is_object()) {
    f.water_policy = read_string(*v, "name", f.water_policy, p);
    WaterPolicyParams& wp = f.water_policy_params;
    wp.include_energy_cost = read_bool(*v, "include_energy_cost", wp.include_energy_cost, p);
    wp.price_threshold_multiplier = read_number(*v, "price_threshold_multiplier", wp.price_threshold_multiplier, p);
    wp.max_gw_ratio = read_number(*v, "max_gw_ratio", wp.max_gw_ratio, p);
    wp.annual_quota_m3 = read_number(*v, "annual_quota_m3", wp.annual_quota_m3, p);
    wp.monthly_variance_pct = read_number(*v, "monthly_variance_pct", wp.monthly_variance_pct, p);
  } else {
    bad(p, "expected a policy name or object");
  }
  if (!water_policy_kind_from_string(f.water_policy, nullptr)) bad(p, "unknown water policy '" + f.water_policy + "'");
}

void read_food_policy(const Value& farm, FarmConfig& f, const std::string& path) {
  const Value* v = member(farm, "food_policy", path);
  if (!v || v->is_null()) return;
  const std::string p = path + ".food_policy";
  if (v->is_string()) {
    f.food_policy = *v->as_string();
  } else if (v->is_object()) {
    f.food_policy = read_string(*v, "name", f.food_policy, p);
    FoodPolicyParams& fp = f.food_policy_params;
    if (const Value* s = v->find("split")) fp.split = read_split(*s, p + ".split");
    fp.price_threshold_fraction = read_number(*v, "price_threshold", fp.price_threshold_fraction, p);
    if (const Value* s = v->find("low_price_split")) fp.low_price_split = read_split(*s, p + ".low_price_split");
    if (const Value* s = v->find("normal_price_split")) {
      fp.normal_price_split = read_split(*s, p + ".normal_price_split");
    }
    if (const Value* refs = v->find("reference_prices")) {
      if (!refs->is_object()) bad(p + ".reference_prices", "expected an object");
      for (const auto& [crop, price] : refs->object()) {
        if (!price.is_number()) bad(p + ".reference_prices." + crop, "expected a number");
        fp.reference_prices_usd_per_kg[crop] = *price.as_number();
      }
    }
  } else {
    bad(p, "expected a policy name or object");
  }
  if (!food_policy_kind_from_string(f.food_policy, nullptr)) bad(p, "unknown food policy '" + f.food_policy + "'");
}

CropPlan read_crop(const Value& v, const std::string& path) {
  CropPlan c;
  c.name = read_string(v, "name", "", path);
  if (c.name.empty()) bad(path + ".name", "crop name is required");
  c.area_fraction = read_number(v, "area_fraction", c.area_fraction, path);
  c.percent_planted = read_number(v, "percent_planted", c.percent_planted, path);
  const Value* dates = member(v, "planting_dates", path);
  if (dates) {
    if (!dates->is_array()) bad(path + ".planting_dates", "expected an array of \"MM-DD\" strings");
    for (std::size_t i = 0; i < dates->array().size(); ++i) {
      const Value& d = dates->array()[i];
      const std::string dp = path + ".planting_dates[" + std::to_string(i) + "]";
      if (!d.is_string()) bad(dp, "expected \"MM-DD\"");
      try {
        (void)Date::parse_month_day(2024, *d.as_string());
      } catch (const std::invalid_argument& e) {
        bad(dp, e.what());
      }
      c.planting_dates.push_back(*d.as_string());
    }
  }
  return c;
}

FarmConfig read_farm(const Value& v, const std::string& path) {
  FarmConfig f;
  f.id = read_string(v, "id", "", path);
  if (f.id.empty()) bad(path + ".id", "farm id is required");
  f.name = read_string(v, "name", f.id, path);
  f.area_ha = read_number(v, "area_ha", f.area_ha, path);
  f.yield_factor = read_number(v, "yield_factor", f.yield_factor, path);
  f.starting_capital_usd = read_number(v, "starting_capital_usd", f.starting_capital_usd, path);
  read_water_policy(v, f, path);
  read_food_policy(v, f, path);
  if (const Value* crops = member(v, "crops", path)) {
    if (!crops->is_array()) bad(path + ".crops", "expected an array");
    for (std::size_t i = 0; i < crops->array().size(); ++i) {
      f.crops.push_back(read_crop(crops->array()[i], path + ".crops[" + std::to_string(i) + "]"));
    }
  }
  return f;
}

void read_infrastructure(const Value& root, Scenario& sc) {
  const std::string path = "infrastructure";
  const Value& infra = section(root, "infrastructure", "scenario");

  const Value& w = section(infra, "wells", path);
  const std::string wp = path + ".wells";
  sc.wells.well_depth_m = read_number(w, "well_depth_m", sc.wells.well_depth_m, wp);
  sc.wells.well_flow_rate_m3_day = read_number(w, "well_flow_rate_m3_day", sc.wells.well_flow_rate_m3_day, wp);
  sc.wells.number_of_wells = read_int(w, "number_of_wells", sc.wells.number_of_wells, wp);
  sc.wells.pipe_distance_km = read_number(w, "pipe_distance_km", sc.wells.pipe_distance_km, wp);
  sc.wells.pipe_diameter_m = read_number(w, "pipe_diameter_m", sc.wells.pipe_diameter_m, wp);
  sc.wells.pump_efficiency = read_number(w, "pump_efficiency", sc.wells.pump_efficiency, wp);

  const Value& t = section(infra, "treatment", path);
  sc.treatment.capacity_m3_day = read_number(t, "capacity_m3_day", sc.treatment.capacity_m3_day, path + ".treatment");
  sc.treatment.salinity_level = read_string(t, "salinity_level", sc.treatment.salinity_level, path + ".treatment");

  const Value& s = section(infra, "storage", path);
  sc.storage.capacity_m3 = read_number(s, "capacity_m3", sc.storage.capacity_m3, path + ".storage");

  const Value& pv = section(infra, "pv", path);
  sc.pv.sys_capacity_kw = read_number(pv, "sys_capacity_kw", sc.pv.sys_capacity_kw, path + ".pv");
  sc.pv.density = read_string(pv, "density", sc.pv.density, path + ".pv");

  const Value& wind = section(infra, "wind", path);
  sc.wind.sys_capacity_kw = read_number(wind, "sys_capacity_kw", sc.wind.sys_capacity_kw, path + ".wind");
  sc.wind.turbine = read_string(wind, "turbine", sc.wind.turbine, path + ".wind");

  const Value& b = section(infra, "battery", path);
  const std::string bp = path + ".battery";
  sc.battery.capacity_kwh = read_number(b, "capacity_kwh", sc.battery.capacity_kwh, bp);
  sc.battery.initial_soc = read_number(b, "initial_soc", sc.battery.initial_soc, bp);
  sc.battery.soc_min = read_number(b, "soc_min", sc.battery.soc_min, bp);
  sc.battery.soc_max = read_number(b, "soc_max", sc.battery.soc_max, bp);
  sc.battery.charge_efficiency = read_number(b, "charge_efficiency", sc.battery.charge_efficiency, bp);
  sc.battery.discharge_efficiency = read_number(b, "discharge_efficiency", sc.battery.discharge_efficiency, bp);

  const Value& g = section(infra, "generator", path);
  const std::string gp = path + ".generator";
  sc.generator.capacity_kw = read_number(g, "capacity_kw", sc.generator.capacity_kw, gp);
  sc.generator.fuel_coeff_a = read_number(g, "fuel_coeff_a", sc.generator.fuel_coeff_a, gp);
  sc.generator.fuel_coeff_b = read_number(g, "fuel_coeff_b", sc.generator.fuel_coeff_b, gp);

  sc.grid_connected = read_bool(infra, "grid_connected", sc.grid_connected, path);
}

void read_pricing(const Value& root, Scenario& sc) {
  const Value& p = section(root, "pricing", "scenario");
  const std::string path = "pricing";
  sc.pricing.agricultural_water = read_regime(p, "agricultural_water", path);
  sc.pricing.domestic_water = read_regime(p, "domestic_water", path);
  sc.pricing.agricultural_energy = read_regime(p, "agricultural_energy", path);
  sc.pricing.domestic_energy = read_regime(p, "domestic_energy", path);

  const Value* tiers = member(p, "agricultural_water_tiers", path);
  if (!tiers || tiers->is_null()) return;
  const std::string tp = path + ".agricultural_water_tiers";
  if (!tiers->is_object()) bad(tp, "expected an object");
  if (!read_bool(*tiers, "enabled", true, tp)) return;

  TierPricing t;
  t.include_wastewater_surcharge = read_bool(*tiers, "include_wastewater_surcharge", false, tp);
  t.wastewater_surcharge_pct = read_number(*tiers, "wastewater_surcharge_pct", t.wastewater_surcharge_pct, tp);
  const Value* brackets = tiers->find("brackets");
  if (!brackets || !brackets->is_array()) bad(tp + ".brackets", "expected an array");
  for (std::size_t i = 0; i < brackets->array().size(); ++i) {
    const Value& b = brackets->array()[i];
    const std::string bp = tp + ".brackets[" + std::to_string(i) + "]";
    TierBracket br;
    br.min_units = read_number(b, "min_units", 0.0, bp);
    br.max_units = read_number(b, "max_units", br.max_units, bp);  // null/absent = open-ended
    br.price_per_unit = read_number(b, "price_per_unit", 0.0, bp);
    t.brackets.push_back(br);
  }
  sc.pricing.agricultural_water_tiers = t;
}

void read_financing(const Value& root, Scenario& sc) {
  const Value& fin = section(root, "financing", "scenario");
  for (const auto& [key, value] : fin.object()) {
    Subsystem s;
    if (!subsystem_from_string(key, &s)) bad("financing." + key, "unknown subsystem");
    if (!value.is_string()) bad("financing." + key, "expected a financing status");
    FinancingStatus f;
    if (!financing_status_from_string(*value.as_string(), &f)) {
      bad("financing." + key, "unknown financing status '" + *value.as_string() + "'");
    }
    sc.set_financing(s, f);
  }

  const Value& rc = section(root, "reference_costs", "scenario");
  const std::string p = "reference_costs";
  ReferenceCosts& r = sc.reference_costs;
  r.well_capex_usd_per_m_depth = read_number(rc, "well_capex_usd_per_m_depth", r.well_capex_usd_per_m_depth, p);
  r.well_om_usd_per_well_yr = read_number(rc, "well_om_usd_per_well_yr", r.well_om_usd_per_well_yr, p);
  r.treatment_capex_usd_per_m3_day =
      read_number(rc, "treatment_capex_usd_per_m3_day", r.treatment_capex_usd_per_m3_day, p);
  r.treatment_om_pct_of_capex = read_number(rc, "treatment_om_pct_of_capex", r.treatment_om_pct_of_capex, p);
  r.storage_capex_usd_per_m3 = read_number(rc, "storage_capex_usd_per_m3", r.storage_capex_usd_per_m3, p);
  r.storage_om_pct_of_capex = read_number(rc, "storage_om_pct_of_capex", r.storage_om_pct_of_capex, p);
  r.irrigation_capex_usd_per_ha = read_number(rc, "irrigation_capex_usd_per_ha", r.irrigation_capex_usd_per_ha, p);
  r.irrigation_om_pct_of_capex = read_number(rc, "irrigation_om_pct_of_capex", r.irrigation_om_pct_of_capex, p);
  r.pv_capex_usd_per_kw = read_number(rc, "pv_capex_usd_per_kw", r.pv_capex_usd_per_kw, p);
  r.pv_om_usd_per_kw_yr = read_number(rc, "pv_om_usd_per_kw_yr", r.pv_om_usd_per_kw_yr, p);
  r.wind_capex_usd_per_kw = read_number(rc, "wind_capex_usd_per_kw", r.wind_capex_usd_per_kw, p);
  r.wind_om_usd_per_kw_yr = read_number(rc, "wind_om_usd_per_kw_yr", r.wind_om_usd_per_kw_yr, p);
  r.battery_capex_usd_per_kwh = read_number(rc, "battery_capex_usd_per_kwh", r.battery_capex_usd_per_kwh, p);
  r.battery_om_pct_of_capex = read_number(rc, "battery_om_pct_of_capex", r.battery_om_pct_of_capex, p);
  r.generator_capex_usd_per_kw = read_number(rc, "generator_capex_usd_per_kw", r.generator_capex_usd_per_kw, p);
  r.generator_om_usd_per_kw_yr = read_number(rc, "generator_om_usd_per_kw_yr", r.generator_om_usd_per_kw_yr, p);
}

// --- lookup tables ---

DailySeries read_series(const Value& v, const std::string& path) {
  if (const double* d = v.as_number()) return DailySeries(*d);
  if (!v.is_object()) bad(path, "expected a number or {\"default\", \"daily\"} object");
  DailySeries s;
  if (const Value* def = v.find("default")) {
    if (!def->is_number()) bad(path + ".default", "expected a number");
    s.set_fallback(*def->as_number());
  }
  if (const Value* daily = v.find("daily")) {
    if (!daily->is_object()) bad(path + ".daily", "expected an object keyed by date");
    for (const auto& [key, val] : daily->object()) {
      if (!val.is_number()) bad(path + ".daily." + key, "expected a number");
      try {
        s.set(Date::parse_iso_ymd(key), *val.as_number());
      } catch (const std::invalid_argument& e) {
        bad(path + ".daily", e.what());
      }
    }
  }
  return s;
}

void read_optional_series(const Value& root, const std::string& key, DailySeries& out) {
  if (const Value* v = root.find(key)) out = read_series(*v, key);
}

std::map<std::string, DailySeries> read_series_map(const Value& root, const std::string& key) {
  std::map<std::string, DailySeries> out;
  const Value* v = root.find(key);
  if (!v) return out;
  if (!v->is_object()) bad(key, "expected an object");
  for (const auto& [name, series] : v->object()) out[name] = read_series(series, key + "." + name);
  return out;
}

std::map<PricingRegime, DailySeries> read_regime_series(const Value& root, const std::string& key) {
  std::map<PricingRegime, DailySeries> out;
  for (auto& [name, series] : read_series_map(root, key)) {
    PricingRegime r;
    if (!pricing_regime_from_string(name, &r)) bad(key + "." + name, "unknown pricing regime");
    out[r] = std::move(series);
  }
  return out;
}

CropSeason read_season(const Value& v, const std::string& path, Date* planting) {
  *planting = read_date(v, "planting_date", path);
  CropSeason s;
  s.harvest_date = read_date(v, "harvest_date", path);
  if (s.harvest_date < *planting) bad(path + ".harvest_date", "harvest before planting");
  s.yield_kg_per_ha = read_number(v, "yield_kg_per_ha", 0.0, path);

  const Value* irr = v.find("irrigation_m3_per_ha");
  if (!irr) bad(path + ".irrigation_m3_per_ha", "required");
  if (const json::Array* days = irr->as_array()) {
    for (std::size_t i = 0; i < days->size(); ++i) {
      if (!(*days)[i].is_number()) bad(path + ".irrigation_m3_per_ha[" + std::to_string(i) + "]", "expected a number");
      s.irrigation_m3_per_ha.set(planting->add_days(static_cast<std::int64_t>(i)), *(*days)[i].as_number());
    }
    // Days past the end of the array need no water.
    s.irrigation_m3_per_ha.set_fallback(0.0);
  } else {
    s.irrigation_m3_per_ha = read_series(*irr, path + ".irrigation_m3_per_ha");
  }
  return s;
}

CropTable read_crop_table(const Value& v, const std::string& path) {
  CropTable c;
  c.ky = read_number(v, "ky", c.ky, path);
  if (const Value* price = v.find("price_usd_per_kg")) c.price_usd_per_kg = read_series(*price, path + ".price_usd_per_kg");

  const Value& pathways = section(v, "pathways", path);
  for (const auto& [name, params] : pathways.object()) {
    const std::string pp = path + ".pathways." + name;
    ProcessingPathway p;
    if (!processing_pathway_from_string(name, &p)) bad(pp, "unknown processing pathway");
    PathwayParams pr;
    pr.weight_loss = read_number(params, "weight_loss", pr.weight_loss, pp);
    pr.post_harvest_loss = read_number(params, "post_harvest_loss", pr.post_harvest_loss, pp);
    pr.value_multiplier = read_number(params, "value_multiplier", pr.value_multiplier, pp);
    c.pathways[p] = pr;
  }

  if (const Value* seasons = v.find("seasons")) {
    if (!seasons->is_array()) bad(path + ".seasons", "expected an array");
    for (std::size_t i = 0; i < seasons->array().size(); ++i) {
      Date planting;
      CropSeason s = read_season(seasons->array()[i], path + ".seasons[" + std::to_string(i) + "]", &planting);
      c.seasons[planting.days_since_epoch()] = std::move(s);
    }
  }
  return c;
}

} // namespace

Scenario load_scenario_json(const std::string& text) {
  const Value root = json::parse(text);
  if (!root.is_object()) bad("scenario", "expected a JSON object");

  Scenario sc;
  sc.name = read_string(root, "name", sc.name, "scenario");
  sc.start_date = read_date(root, "start_date", "scenario");
  sc.end_date = read_date(root, "end_date", "scenario");

  read_infrastructure(root, sc);

  const Value& aq = section(root, "aquifer", "scenario");
  sc.aquifer.exploitable_volume_m3 = read_number(aq, "exploitable_volume_m3", 0.0, "aquifer");
  sc.aquifer.recharge_rate_m3_yr = read_number(aq, "recharge_rate_m3_yr", 0.0, "aquifer");
  sc.aquifer.max_drawdown_m = read_number(aq, "max_drawdown_m", 0.0, "aquifer");

  read_pricing(root, sc);
  read_financing(root, sc);

  const Value* farms = root.find("farms");
  if (!farms || !farms->is_array()) bad("scenario.farms", "expected an array");
  for (std::size_t i = 0; i < farms->array().size(); ++i) {
    sc.farms.push_back(read_farm(farms->array()[i], "farms[" + std::to_string(i) + "]"));
  }
  return sc;
}

Scenario load_scenario_file(const std::string& path) { return load_scenario_json(read_text_file(path)); }

LookupTables load_data_tables_json(const std::string& text) {
  const Value root = json::parse(text);
  if (!root.is_object()) bad("data", "expected a JSON object");

  LookupTables t;
  if (const Value* treat = root.find("treatment_kwh_per_m3")) {
    if (!treat->is_object()) bad("treatment_kwh_per_m3", "expected an object keyed by salinity level");
    for (const auto& [level, v] : treat->object()) {
      if (!v.is_number()) bad("treatment_kwh_per_m3." + level, "expected a number");
      t.treatment_kwh_per_m3[level] = *v.as_number();
    }
  }
  t.pv_kwh_per_kw = read_series_map(root, "pv_kwh_per_kw");
  t.wind_kwh_per_kw = read_series_map(root, "wind_kwh_per_kw");
  t.municipal_water_price = read_regime_series(root, "municipal_water_price_usd_per_m3");
  t.electricity_price = read_regime_series(root, "electricity_price_usd_per_kwh");
  read_optional_series(root, "diesel_price_usd_per_l", t.diesel_price);
  read_optional_series(root, "fertilizer_cost_usd_per_ha", t.fertilizer_cost);
  read_optional_series(root, "household_energy_kwh", t.household_energy);
  read_optional_series(root, "building_energy_kwh", t.building_energy);
  read_optional_series(root, "household_water_m3", t.household_water);
  read_optional_series(root, "building_water_m3", t.building_water);

  if (const Value* crops = root.find("crops")) {
    if (!crops->is_object()) bad("crops", "expected an object keyed by crop name");
    for (const auto& [name, v] : crops->object()) t.crops[name] = read_crop_table(v, "crops." + name);
  }
  return t;
}

std::shared_ptr<const TableDataProvider> load_data_tables_file(const std::string& path) {
  return std::make_shared<const TableDataProvider>(load_data_tables_json(read_text_file(path)));
}

} // namespace agripv
