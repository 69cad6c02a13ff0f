#pragma once

#include <string>

#include "agripv/core/simulation.h"

namespace agripv {

// Export a finished (or partially run) simulation as structured JSON.
//
// The document holds the scenario name, yearly farm and energy metrics, the
// economic summary (with per-subsystem infrastructure cost), the aquifer and storage
// state and community totals. With `include_daily` the per-day water, energy and
// storage audit rows are added as well.
//
// Output ends with a trailing newline.
std::string results_to_json(const Simulation& sim, bool include_daily = false);

// One row per farm per day: demand, sources, cost and the policy's decision reason.
std::string daily_water_to_csv(const SimulationState& state);

// One row per day of energy dispatch.
std::string daily_energy_to_csv(const SimulationState& state);

// One row per farm per year.
std::string yearly_farm_metrics_to_csv(const SimulationState& state);

} // namespace agripv
