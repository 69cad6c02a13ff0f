#include "agripv/core/data_provider.h"

#include <stdexcept>

namespace agripv {
namespace {

template <typename K>
const DailySeries& series_for(const std::map<K, DailySeries>& m, const K& key, const std::string& table,
                              const std::string& key_label) {
  const auto it = m.find(key);
  if (it == m.end()) throw std::out_of_range("No " + table + " table for '" + key_label + "'");
  return it->second;
}

} // namespace

double DailySeries::at(Date d, const std::string& what) const {
  const auto it = values_.find(d.days_since_epoch());
  if (it != values_.end()) return it->second;
  if (fallback_) return *fallback_;
  throw std::out_of_range("No " + what + " data for " + d.to_string());
}

const CropTable& TableDataProvider::crop(const std::string& name) const {
  const auto it = t_.crops.find(name);
  if (it == t_.crops.end()) throw std::out_of_range("Unknown crop in lookup tables: " + name);
  return it->second;
}

double TableDataProvider::irrigation_m3_per_ha(const std::string& crop_name, Date planting, Date date) const {
  const CropTable& c = crop(crop_name);
  const auto it = c.seasons.find(planting.days_since_epoch());
  if (it == c.seasons.end()) {
    throw std::out_of_range("No irrigation season for " + crop_name + " planted " + planting.to_string());
  }
  if (date < planting || date > it->second.harvest_date) return 0.0;
  return it->second.irrigation_m3_per_ha.at(date, crop_name + " irrigation");
}

std::optional<YieldInfo> TableDataProvider::yield_info(const std::string& crop_name, Date planting) const {
  const auto c = t_.crops.find(crop_name);
  if (c == t_.crops.end()) return std::nullopt;
  const auto it = c->second.seasons.find(planting.days_since_epoch());
  if (it == c->second.seasons.end()) return std::nullopt;
  return YieldInfo{it->second.yield_kg_per_ha, it->second.harvest_date};
}

double TableDataProvider::yield_response_factor(const std::string& crop_name) const { return crop(crop_name).ky; }

PathwayParams TableDataProvider::pathway_params(const std::string& crop_name, ProcessingPathway p) const {
  const CropTable& c = crop(crop_name);
  const auto it = c.pathways.find(p);
  if (it == c.pathways.end()) {
    // Selling fresh with no recorded losses is the neutral pathway.
    if (p == ProcessingPathway::Fresh) return PathwayParams{};
    throw std::out_of_range("No " + std::string(processing_pathway_id(p)) + " processing data for " + crop_name);
  }
  return it->second;
}

double TableDataProvider::crop_price_usd_per_kg(const std::string& crop_name, Date date) const {
  return crop(crop_name).price_usd_per_kg.at(date, crop_name + " price");
}

double TableDataProvider::municipal_water_price_usd_per_m3(PricingRegime regime, Date date) const {
  return series_for(t_.municipal_water_price, regime, "municipal water price", pricing_regime_id(regime))
      .at(date, "municipal water price");
}

double TableDataProvider::electricity_price_usd_per_kwh(PricingRegime regime, Date date) const {
  return series_for(t_.electricity_price, regime, "electricity price", pricing_regime_id(regime))
      .at(date, "electricity price");
}

double TableDataProvider::diesel_price_usd_per_l(Date date) const { return t_.diesel_price.at(date, "diesel price"); }

double TableDataProvider::fertilizer_cost_usd_per_ha(Date date) const {
  return t_.fertilizer_cost.at(date, "fertilizer cost");
}

double TableDataProvider::pv_kwh_per_kw(Date date, const std::string& density) const {
  return series_for(t_.pv_kwh_per_kw, density, "PV output", density).at(date, "PV output (" + density + ")");
}

double TableDataProvider::wind_kwh_per_kw(Date date, const std::string& turbine) const {
  return series_for(t_.wind_kwh_per_kw, turbine, "wind output", turbine).at(date, "wind output (" + turbine + ")");
}

double TableDataProvider::household_energy_kwh(Date date) const {
  return t_.household_energy.at(date, "household energy");
}

double TableDataProvider::building_energy_kwh(Date date) const {
  return t_.building_energy.at(date, "community building energy");
}

double TableDataProvider::household_water_m3(Date date) const { return t_.household_water.at(date, "household water"); }

double TableDataProvider::building_water_m3(Date date) const {
  return t_.building_water.at(date, "community building water");
}

double TableDataProvider::treatment_kwh_per_m3(const std::string& salinity_level) const {
  const auto it = t_.treatment_kwh_per_m3.find(salinity_level);
  if (it == t_.treatment_kwh_per_m3.end()) {
    throw std::out_of_range("No treatment energy for salinity level '" + salinity_level + "'");
  }
  return it->second;
}

} // namespace agripv
