#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "agripv/core/date.h"
#include "agripv/core/food_policy.h"
#include "agripv/core/scenario.h"

namespace agripv {

struct YieldInfo {
  double yield_kg_per_ha{0.0};
  Date harvest_date;
};

struct PathwayParams {
  // Mass lost in processing (drying water, trimming), fraction of raw input.
  double weight_loss{0.0};
  // Spoilage after processing, fraction of processed output.
  double post_harvest_loss{0.0};
  // Price of the processed product relative to the fresh farmgate price.
  double value_multiplier{1.0};
};

// Read-only lookup tables consumed by the engine.
//
// Implementations must be safe to share between concurrently running simulations
// (all methods are const and must not mutate observable state).
//
// Every lookup except yield_info() throws std::out_of_range when the table has no
// entry for the key; a run never silently substitutes zeros for missing data.
class DataProvider {
 public:
  virtual ~DataProvider() = default;

  // Daily irrigation requirement (m3/ha) on `date` for the season of `crop` that
  // started on `planting`. Zero outside [planting, harvest].
  virtual double irrigation_m3_per_ha(const std::string& crop, Date planting, Date date) const = 0;

  // nullopt when no yield curve exists for this crop/planting date.
  virtual std::optional<YieldInfo> yield_info(const std::string& crop, Date planting) const = 0;

  // FAO-33 yield response factor.
  virtual double yield_response_factor(const std::string& crop) const = 0;
  virtual PathwayParams pathway_params(const std::string& crop, ProcessingPathway p) const = 0;

  virtual double crop_price_usd_per_kg(const std::string& crop, Date date) const = 0;
  virtual double municipal_water_price_usd_per_m3(PricingRegime regime, Date date) const = 0;
  virtual double electricity_price_usd_per_kwh(PricingRegime regime, Date date) const = 0;
  virtual double diesel_price_usd_per_l(Date date) const = 0;
  virtual double fertilizer_cost_usd_per_ha(Date date) const = 0;

  // Daily energy per kW installed.
  virtual double pv_kwh_per_kw(Date date, const std::string& density) const = 0;
  virtual double wind_kwh_per_kw(Date date, const std::string& turbine) const = 0;

  virtual double household_energy_kwh(Date date) const = 0;
  virtual double building_energy_kwh(Date date) const = 0;
  virtual double household_water_m3(Date date) const = 0;
  virtual double building_water_m3(Date date) const = 0;

  virtual double treatment_kwh_per_m3(const std::string& salinity_level) const = 0;
};

// Per-day values with an optional fallback for days not listed.
class DailySeries {
 public:
  DailySeries() = default;
  explicit DailySeries(double constant) : fallback_(constant) {}

  void set(Date d, double v) { values_[d.days_since_epoch()] = v; }
  void set_fallback(double v) { fallback_ = v; }

  bool has(Date d) const { return fallback_.has_value() || values_.count(d.days_since_epoch()) != 0; }

  // Throws std::out_of_range (mentioning `what`) if the day is missing and no fallback exists.
  double at(Date d, const std::string& what) const;

  std::size_t size() const { return values_.size(); }

 private:
  std::map<std::int64_t, double> values_;
  std::optional<double> fallback_;
};

struct CropSeason {
  Date harvest_date;
  double yield_kg_per_ha{0.0};
  // Indexed by calendar date; days inside the season but not listed fall back to the
  // series default (or throw).
  DailySeries irrigation_m3_per_ha;
};

struct CropTable {
  double ky{1.0};
  DailySeries price_usd_per_kg;
  std::map<ProcessingPathway, PathwayParams> pathways;
  // Keyed by planting day (days since epoch).
  std::map<std::int64_t, CropSeason> seasons;
};

struct LookupTables {
  std::map<std::string, CropTable> crops;

  std::map<PricingRegime, DailySeries> municipal_water_price;
  std::map<PricingRegime, DailySeries> electricity_price;
  DailySeries diesel_price;
  DailySeries fertilizer_cost;

  std::map<std::string, DailySeries> pv_kwh_per_kw;
  std::map<std::string, DailySeries> wind_kwh_per_kw;

  DailySeries household_energy;
  DailySeries building_energy;
  DailySeries household_water;
  DailySeries building_water;

  std::map<std::string, double> treatment_kwh_per_m3;
};

// DataProvider over in-memory tables, typically filled by load_data_tables_json().
// A crop without a "fresh" pathway entry is sold fresh with no losses.
class TableDataProvider final : public DataProvider {
 public:
  explicit TableDataProvider(LookupTables tables) : t_(std::move(tables)) {}

  const LookupTables& tables() const { return t_; }

  double irrigation_m3_per_ha(const std::string& crop, Date planting, Date date) const override;
  std::optional<YieldInfo> yield_info(const std::string& crop, Date planting) const override;
  double yield_response_factor(const std::string& crop) const override;
  PathwayParams pathway_params(const std::string& crop, ProcessingPathway p) const override;

  double crop_price_usd_per_kg(const std::string& crop, Date date) const override;
  double municipal_water_price_usd_per_m3(PricingRegime regime, Date date) const override;
  double electricity_price_usd_per_kwh(PricingRegime regime, Date date) const override;
  double diesel_price_usd_per_l(Date date) const override;
  double fertilizer_cost_usd_per_ha(Date date) const override;

  double pv_kwh_per_kw(Date date, const std::string& density) const override;
  double wind_kwh_per_kw(Date date, const std::string& turbine) const override;

  double household_energy_kwh(Date date) const override;
  double building_energy_kwh(Date date) const override;
  double household_water_m3(Date date) const override;
  double building_water_m3(Date date) const override;

  double treatment_kwh_per_m3(const std::string& salinity_level) const override;

 private:
  const CropTable& crop(const std::string& name) const;

  LookupTables t_;
};

} // namespace agripv
