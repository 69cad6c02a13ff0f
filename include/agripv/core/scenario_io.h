#pragma once

#include <memory>
#include <string>

#include "agripv/core/data_provider.h"
#include "agripv/core/scenario.h"

namespace agripv {

// Scenario JSON:
//   { "name", "start_date", "end_date",
//     "infrastructure": { "wells", "treatment", "storage", "pv", "wind", "battery",
//                         "generator", "grid_connected" },
//     "aquifer", "pricing", "financing", "reference_costs",
//     "farms": [ { "id", "area_ha", "water_policy", "food_policy", "crops": [...] } ] }
//
// Omitted fields keep their struct defaults. A policy may be given as a bare name or
// as { "name": ..., <params> }.
//
// Malformed JSON throws std::runtime_error (with line/column). Wrong types, unknown
// enumerations (policy names, regimes, financing statuses) and bad dates throw
// std::invalid_argument naming the offending path.
Scenario load_scenario_json(const std::string& text);
Scenario load_scenario_file(const std::string& path);

// Lookup-table JSON. A daily series is either a constant number or
// { "default": x, "daily": { "YYYY-MM-DD": v, ... } }. Season irrigation may also be
// an array indexed by days since planting.
LookupTables load_data_tables_json(const std::string& text);
std::shared_ptr<const TableDataProvider> load_data_tables_file(const std::string& path);

} // namespace agripv
