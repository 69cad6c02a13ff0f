#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "agripv/core/date.h"

namespace agripv {

// --- tariff selection ---
//
// Each regime picks one of the price series carried by the lookup tables.
enum class PricingRegime : std::uint8_t {
  Subsidized = 0,
  Unsubsidized = 1,
};

const char* pricing_regime_id(PricingRegime r);
// Returns false on unknown input.
bool pricing_regime_from_string(std::string_view s, PricingRegime* out);

// --- shared infrastructure financing ---

enum class Subsystem : std::uint8_t {
  Wells = 0,
  WaterTreatment,
  IrrigationStorage,
  IrrigationSystem,
  Pv,
  Wind,
  Battery,
  Generator,
};

inline constexpr std::size_t kSubsystemCount = 8;
inline constexpr std::array<Subsystem, kSubsystemCount> kAllSubsystems = {
    Subsystem::Wells,           Subsystem::WaterTreatment, Subsystem::IrrigationStorage, Subsystem::IrrigationSystem,
    Subsystem::Pv,              Subsystem::Wind,           Subsystem::Battery,           Subsystem::Generator,
};

const char* subsystem_id(Subsystem s);
bool subsystem_from_string(std::string_view s, Subsystem* out);

enum class FinancingStatus : std::uint8_t {
  ExistingOwned = 0,
  GrantFull,
  GrantCapex,
  PurchasedCash,
  LoanStandard,
  LoanConcessional,
};

const char* financing_status_id(FinancingStatus f);
bool financing_status_from_string(std::string_view s, FinancingStatus* out);

// Unit costs used to size capital and O&M of each subsystem.
struct ReferenceCosts {
  double well_capex_usd_per_m_depth{250.0};
  double well_om_usd_per_well_yr{1500.0};

  // Per m3/day of treatment capacity.
  double treatment_capex_usd_per_m3_day{1000.0};
  double treatment_om_pct_of_capex{5.0};

  double storage_capex_usd_per_m3{150.0};
  double storage_om_pct_of_capex{1.0};

  double irrigation_capex_usd_per_ha{2000.0};
  double irrigation_om_pct_of_capex{3.0};

  double pv_capex_usd_per_kw{900.0};
  double pv_om_usd_per_kw_yr{15.0};

  double wind_capex_usd_per_kw{1500.0};
  double wind_om_usd_per_kw_yr{40.0};

  double battery_capex_usd_per_kwh{400.0};
  double battery_om_pct_of_capex{2.0};

  double generator_capex_usd_per_kw{500.0};
  double generator_om_usd_per_kw_yr{20.0};
};

// --- farms ---

struct WaterPolicyParams {
  // cheapest_source: when false, only O&M cost enters the source comparison.
  bool include_energy_cost{true};

  // conserve_groundwater
  double price_threshold_multiplier{1.5};
  double max_gw_ratio{0.30};

  // quota_enforced
  double annual_quota_m3{0.0};
  double monthly_variance_pct{0.15};
};

// Shares of a harvest sent down each processing pathway. Must sum to 1.
struct ProcessingSplit {
  double fresh{1.0};
  double packaged{0.0};
  double canned{0.0};
  double dried{0.0};

  double sum() const { return fresh + packaged + canned + dried; }
};

struct FoodPolicyParams {
  // maximize_storage / balanced_mix: replaces the policy's built-in split.
  std::optional<ProcessingSplit> split;

  // market_responsive: prices below this fraction of the reference are "low".
  double price_threshold_fraction{0.80};
  std::optional<ProcessingSplit> low_price_split;
  std::optional<ProcessingSplit> normal_price_split;

  // Overrides for the built-in reference prices (USD/kg, keyed by crop name).
  std::map<std::string, double> reference_prices_usd_per_kg;
};

struct CropPlan {
  std::string name;
  // Share of the farm's area given to this crop.
  double area_fraction{1.0};
  // Share of that area actually planted each season.
  double percent_planted{1.0};
  // Season starts as "MM-DD", repeated every simulated year.
  std::vector<std::string> planting_dates;
};

struct FarmConfig {
  std::string id;
  std::string name;
  double area_ha{0.0};
  // Multiplies the tabulated yield per hectare (management quality, soil, ...).
  double yield_factor{1.0};
  double starting_capital_usd{0.0};

  std::string water_policy{"cheapest_source"};
  WaterPolicyParams water_policy_params;

  std::string food_policy{"all_fresh"};
  FoodPolicyParams food_policy_params;

  std::vector<CropPlan> crops;
};

// --- community infrastructure ---

struct WellConfig {
  double well_depth_m{50.0};
  double well_flow_rate_m3_day{100.0};
  int number_of_wells{1};
  // Horizontal run from the wellfield to the treatment plant.
  double pipe_distance_km{0.3};
  double pipe_diameter_m{0.1};
  double pump_efficiency{0.60};
};

struct TreatmentConfig {
  double capacity_m3_day{1000.0};
  // Key into the treatment-energy table ("low", "moderate", "high", ...).
  std::string salinity_level{"moderate"};
};

struct StorageConfig {
  double capacity_m3{500.0};
};

struct PvConfig {
  double sys_capacity_kw{0.0};
  // Panel density over the fields: "low", "medium" or "high". Also selects the
  // capacity-factor series and the crop shading factor.
  std::string density{"medium"};
};

struct WindConfig {
  double sys_capacity_kw{0.0};
  // Key into the wind capacity-factor table.
  std::string turbine{"medium"};
};

struct BatteryConfig {
  double capacity_kwh{0.0};
  double initial_soc{0.5};
  double soc_min{0.10};
  double soc_max{0.90};
  double charge_efficiency{0.95};
  double discharge_efficiency{0.95};
};

// Willans-line backup generator: fuel_L/h = a * P_rated + b * P_output.
struct GeneratorConfig {
  double capacity_kw{0.0};
  double fuel_coeff_a{0.06};
  double fuel_coeff_b{0.20};
};

struct AquiferConfig {
  double exploitable_volume_m3{0.0};
  double recharge_rate_m3_yr{0.0};
  // Extra pumping head once the exploitable volume is fully drawn.
  double max_drawdown_m{0.0};
};

// One bracket of a progressive monthly tariff. max_units is exclusive; the final
// bracket is usually open-ended.
struct TierBracket {
  double min_units{0.0};
  double max_units{std::numeric_limits<double>::infinity()};
  double price_per_unit{0.0};
};

struct TierPricing {
  std::vector<TierBracket> brackets;
  bool include_wastewater_surcharge{false};
  double wastewater_surcharge_pct{75.0};
};

struct PricingConfig {
  PricingRegime agricultural_water{PricingRegime::Subsidized};
  PricingRegime domestic_water{PricingRegime::Subsidized};
  PricingRegime agricultural_energy{PricingRegime::Subsidized};
  PricingRegime domestic_energy{PricingRegime::Subsidized};

  // When present, each farm's municipal irrigation water is billed progressively on its
  // monthly municipal consumption instead of at the flat daily price.
  std::optional<TierPricing> agricultural_water_tiers;
};

struct Scenario {
  std::string name{"unnamed"};

  // Inclusive horizon.
  Date start_date;
  Date end_date;

  WellConfig wells;
  TreatmentConfig treatment;
  StorageConfig storage;
  PvConfig pv;
  WindConfig wind;
  BatteryConfig battery;
  GeneratorConfig generator;
  AquiferConfig aquifer;
  bool grid_connected{true};

  PricingConfig pricing;

  std::array<FinancingStatus, kSubsystemCount> financing{};
  ReferenceCosts reference_costs;

  std::vector<FarmConfig> farms;

  FinancingStatus financing_for(Subsystem s) const { return financing[static_cast<std::size_t>(s)]; }
  void set_financing(Subsystem s, FinancingStatus f) { financing[static_cast<std::size_t>(s)] = f; }

  double total_farm_area_ha() const;
};

} // namespace agripv
