#pragma once

#include <memory>
#include <string>
#include <vector>

#include "agripv/core/aquifer.h"
#include "agripv/core/data_provider.h"
#include "agripv/core/date.h"
#include "agripv/core/economics.h"
#include "agripv/core/energy_dispatch.h"
#include "agripv/core/farm.h"
#include "agripv/core/food_policy.h"
#include "agripv/core/scenario.h"
#include "agripv/core/water_policy.h"
#include "agripv/core/water_storage.h"

namespace agripv {

// Model constants that are not part of a scenario.
struct SimConfig {
  // Energy to move treated water from the plant to the fields (kWh/m3).
  double conveyance_kwh_per_m3{0.2};

  // Groundwater O&M cost (USD/m3): pump wear, membrane replacement, etc.
  double gw_maintenance_usd_per_m3{0.05};

  // Fractional PV output lost per year of operation, compounded.
  double pv_degradation_rate_per_yr{0.005};

  // Storage tank fill level on day one, as a fraction of capacity.
  double initial_storage_fraction{0.5};

  // Straight-line depreciation period for cash-purchased infrastructure.
  int depreciation_years{15};

  // When false, a planting with no yield curve is skipped with a warning.
  // When true, it is a configuration error raised by the constructor.
  bool strict_plantings{false};

  // Emit a debug log line every N simulated days. 0 disables.
  int progress_log_interval_days{30};
};

// Community-wide domestic totals for the whole run.
struct CommunityTotals {
  double household_water_m3{0.0};
  double building_water_m3{0.0};
  double household_energy_kwh{0.0};
  double building_energy_kwh{0.0};
  double domestic_water_cost_usd{0.0};
  double domestic_energy_cost_usd{0.0};
  double diesel_cost_usd{0.0};
  double fertilizer_cost_usd{0.0};
};

struct SimulationState {
  // Next day to simulate.
  Date current_date;
  int current_year{0};
  int days_simulated{0};

  std::vector<FarmState> farms;
  AquiferState aquifer;
  WaterStorageState storage;
  EnergyState energy;
  EconomicState economics;
  CommunityTotals community;

  std::vector<YearlyFarmMetrics> yearly_farm_metrics;
  std::vector<YearlyEnergyMetrics> yearly_energy_metrics;

  // "<farm>/<crop>@<date>" for each season dropped for lack of yield data.
  std::vector<std::string> skipped_plantings;

  double years_elapsed() const { return days_simulated / 365.25; }
};

class Simulation {
 public:
  // Validates the scenario, instantiates policies and plans every season of the
  // horizon. Throws std::invalid_argument on any configuration error, so nothing is
  // simulated for a broken setup.
  Simulation(Scenario scenario, std::shared_ptr<const DataProvider> data, SimConfig cfg = {});

  const Scenario& scenario() const { return scenario_; }
  const SimConfig& cfg() const { return cfg_; }
  const DataProvider& data() const { return *data_; }

  const SimulationState& state() const { return state_; }

  // True once current_date has passed end_date.
  bool finished() const { return state_.current_date > scenario_.end_date; }
  bool finalized() const { return finalized_; }

  // Simulates one calendar day. Throws std::logic_error when already finished.
  void step_day();

  // Advance simulation by up to N days, stopping at the end date.
  // Returns the number of days actually simulated.
  int advance_days(int days);

  // Writes the last year's snapshots and economic rollup. Runs once; later calls
  // are no-ops. Throws std::logic_error before the horizon is complete.
  void finalize();

  // Simulates the remaining horizon and finalizes.
  const SimulationState& run();

  // "<farm id>: <water policy description>; food <food policy id>" per farm, in
  // scenario order.
  std::vector<std::string> describe_policies() const;

 private:
  void plan_all_seasons();
  void plant_year(int year);
  void close_year(int year);
  void begin_year(int year);

  struct DayContext;
  void tick_domestic(DayContext& day);
  void tick_farms(DayContext& day);
  void tick_harvests(const DayContext& day);
  void tick_storage(const DayContext& day);
  void tick_energy(const DayContext& day);

  Scenario scenario_;
  SimConfig cfg_;
  std::shared_ptr<const DataProvider> data_;

  // Parallel to state_.farms.
  std::vector<std::unique_ptr<WaterPolicy>> water_policies_;
  std::vector<std::unique_ptr<FoodPolicy>> food_policies_;
  // [farm][year - first year] -> seasons starting that year.
  std::vector<std::vector<std::vector<CropPlanting>>> scheduled_;

  double treatment_kwh_per_m3_{0.0};

  SimulationState state_;
  bool finalized_{false};
};

// Convenience wrapper: construct, run, return the final state.
SimulationState run_simulation(const Scenario& scenario, std::shared_ptr<const DataProvider> data,
                               const SimConfig& cfg = {});

} // namespace agripv
