#pragma once

#include <string>
#include <vector>

#include "agripv/core/scenario.h"

namespace agripv {

// Checks a scenario for values the engine cannot run with: inverted horizon,
// non-positive areas or capacities, unknown policy names, bad battery bounds,
// fractions outside [0, 1], malformed planting dates, unsorted tier brackets, ...
//
// Returns human-readable problems in the order found. Empty => valid.
std::vector<std::string> validate_scenario(const Scenario& sc);

} // namespace agripv
