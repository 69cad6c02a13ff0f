#include "agripv/core/simulation.h"

#include "simulation_internal.h"

#include <stdexcept>

#include "agripv/core/crop.h"
#include "agripv/core/scenario_validation.h"
#include "agripv/util/log.h"
#include "agripv/util/strings.h"

namespace agripv {

Simulation::Simulation(Scenario scenario, std::shared_ptr<const DataProvider> data, SimConfig cfg)
    : scenario_(std::move(scenario)), cfg_(cfg), data_(std::move(data)) {
  if (!data_) throw std::invalid_argument("Simulation requires a data provider");

  const std::vector<std::string> errors = validate_scenario(scenario_);
  if (!errors.empty()) {
    throw std::invalid_argument("Invalid scenario '" + scenario_.name + "':\n  " + join(errors, "\n  "));
  }
  if (cfg_.depreciation_years <= 0) throw std::invalid_argument("SimConfig: depreciation_years must be > 0");
  if (cfg_.pv_degradation_rate_per_yr < 0.0 || cfg_.pv_degradation_rate_per_yr >= 1.0) {
    throw std::invalid_argument("SimConfig: pv_degradation_rate_per_yr must be in [0, 1)");
  }

  for (const auto& f : scenario_.farms) {
    water_policies_.push_back(make_water_policy(f.water_policy, f.water_policy_params));
    food_policies_.push_back(make_food_policy(f.food_policy, f.food_policy_params));
    state_.farms.push_back(make_farm_state(f));
  }

  treatment_kwh_per_m3_ = data_->treatment_kwh_per_m3(scenario_.treatment.salinity_level);

  state_.current_date = scenario_.start_date;
  state_.current_year = scenario_.start_date.year();
  state_.aquifer = AquiferState(scenario_.aquifer);
  state_.storage = WaterStorageState(scenario_.storage.capacity_m3, cfg_.initial_storage_fraction);
  state_.energy = make_energy_state(scenario_);
  state_.economics = make_economic_state(scenario_, cfg_.depreciation_years);

  plan_all_seasons();
  plant_year(state_.current_year);

  log::info("Scenario '" + scenario_.name + "': " + std::to_string(scenario_.farms.size()) + " farm(s), " +
            scenario_.start_date.to_string() + " to " + scenario_.end_date.to_string());
  for (const std::string& line : describe_policies()) log::info("  " + line);
}

std::vector<std::string> Simulation::describe_policies() const {
  std::vector<std::string> out;
  out.reserve(scenario_.farms.size());
  for (std::size_t fi = 0; fi < scenario_.farms.size(); ++fi) {
    out.push_back(scenario_.farms[fi].id + ": " + water_policies_[fi]->describe() + "; food " +
                  food_policies_[fi]->id());
  }
  return out;
}

void Simulation::plan_all_seasons() {
  const int first_year = scenario_.start_date.year();
  const int years = scenario_.end_date.year() - first_year + 1;
  scheduled_.assign(scenario_.farms.size(), std::vector<std::vector<CropPlanting>>(static_cast<std::size_t>(years)));

  for (std::size_t fi = 0; fi < scenario_.farms.size(); ++fi) {
    const FarmConfig& farm = scenario_.farms[fi];
    std::vector<CropPlanting> whole_horizon;
    for (int y = 0; y < years; ++y) {
      for (const CropPlan& plan : farm.crops) {
        for (const std::string& mm_dd : plan.planting_dates) {
          const std::string where = farm.id + "/" + plan.name + "@" + std::to_string(first_year + y) + "-" + mm_dd;
          std::optional<CropPlanting> p;
          try {
            p = plan_crop_planting(farm, plan, first_year + y, mm_dd, *data_);
          } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("Planting " + where + ": " + e.what());
          }
          if (!p) {
            if (cfg_.strict_plantings) throw std::invalid_argument("No yield data for planting " + where);
            log::warn("Skipping planting " + where + ": no yield data");
            state_.skipped_plantings.push_back(where);
            continue;
          }
          whole_horizon.push_back(*p);
          scheduled_[fi][static_cast<std::size_t>(y)].push_back(std::move(*p));
        }
      }
    }

    const std::vector<std::string> overlaps = find_planting_overlaps(whole_horizon);
    if (!overlaps.empty()) {
      throw std::invalid_argument("Overlapping plantings on farm '" + farm.id + "':\n  " + join(overlaps, "\n  "));
    }
  }
}

void Simulation::plant_year(int year) {
  const int index = year - scenario_.start_date.year();
  for (std::size_t fi = 0; fi < state_.farms.size(); ++fi) {
    if (index < 0 || index >= static_cast<int>(scheduled_[fi].size())) continue;
    FarmState& farm = state_.farms[fi];
    for (CropPlanting& p : scheduled_[fi][static_cast<std::size_t>(index)]) {
      const double fertilizer = p.area_ha * data_->fertilizer_cost_usd_per_ha(p.planting_date);
      farm.year.fertilizer_cost_usd += fertilizer;
      state_.community.fertilizer_cost_usd += fertilizer;
      add_operating_cost(state_.economics, fertilizer);
      farm.plantings.push_back(std::move(p));
    }
    scheduled_[fi][static_cast<std::size_t>(index)].clear();
  }
}

void Simulation::close_year(int year) {
  double revenue = 0.0;
  double water_cost = 0.0;
  for (const FarmState& farm : state_.farms) {
    state_.yearly_farm_metrics.push_back(snapshot_farm_year(farm, year));
    revenue += farm.year.crop_revenue_usd;
    water_cost += farm.year.water_cost_usd;
  }
  state_.yearly_energy_metrics.push_back(snapshot_energy_year(state_.energy, year));
  roll_economic_year(state_.economics, revenue, water_cost);

  log::info("Year " + std::to_string(year) + " closed: revenue $" + format_fixed(revenue, 0) + ", water cost $" +
            format_fixed(water_cost, 0) + ", cash $" + format_fixed(state_.economics.cash_reserves_usd, 0));
}

void Simulation::begin_year(int year) {
  for (FarmState& farm : state_.farms) reset_farm_year(farm);
  reset_energy_year(state_.energy);
  state_.current_year = year;
  plant_year(year);
}

void Simulation::step_day() {
  if (finished()) throw std::logic_error("step_day() called after end_date");

  const Date date = state_.current_date;
  const int year = date.year();
  if (year != state_.current_year) {
    close_year(state_.current_year);
    begin_year(year);
  }

  DayContext day;
  day.date = date;
  day.month = date.month();

  tick_domestic(day);
  tick_farms(day);
  tick_harvests(day);
  tick_storage(day);
  tick_energy(day);

  ++state_.days_simulated;
  state_.current_date = date.add_days(1);

  if (cfg_.progress_log_interval_days > 0 && state_.days_simulated % cfg_.progress_log_interval_days == 0) {
    log::debug("Simulated through " + date.to_string() + ", battery SOC " + format_fixed(state_.energy.soc, 3) +
               ", aquifer drawn " + format_fixed(state_.aquifer.cumulative_extraction_m3(), 0) + " m3");
  }
}

int Simulation::advance_days(int days) {
  int done = 0;
  while (done < days && !finished()) {
    step_day();
    ++done;
  }
  return done;
}

void Simulation::finalize() {
  if (finalized_) return;
  if (!finished()) throw std::logic_error("finalize() called before end_date was reached");
  close_year(state_.current_year);
  finalized_ = true;
  log::info("Run complete: " + std::to_string(state_.days_simulated) + " days, " +
            std::to_string(state_.skipped_plantings.size()) + " planting(s) skipped");
}

const SimulationState& Simulation::run() {
  while (!finished()) step_day();
  finalize();
  return state_;
}

SimulationState run_simulation(const Scenario& scenario, std::shared_ptr<const DataProvider> data,
                               const SimConfig& cfg) {
  Simulation sim(scenario, std::move(data), cfg);
  return sim.run();
}

} // namespace agripv
