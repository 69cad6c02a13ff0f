#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "agripv/core/scenario_io.h"
#include "agripv/core/scenario_validation.h"
#include "agripv/core/simulation.h"
#include "agripv/util/file_io.h"
#include "agripv/util/log.h"
#include "agripv/util/results_export.h"
#include "agripv/util/strings.h"

namespace {

#ifndef AGRIPV_VERSION
#define AGRIPV_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "agripv CLI v" << AGRIPV_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "agripv_cli") << " --scenario PATH --data PATH [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --scenario PATH   Scenario JSON (farms, infrastructure, pricing, financing)\n";
  std::cout << "  --data PATH       Lookup-table JSON (irrigation, yields, prices, capacity factors)\n";
  std::cout << "  --out PATH        Write results JSON\n";
  std::cout << "  --daily           Include per-day water/energy/storage rows in the results JSON\n";
  std::cout << "  --water-csv PATH  Write the daily farm water ledger as CSV\n";
  std::cout << "  --energy-csv PATH Write the daily energy dispatch as CSV\n";
  std::cout << "  --yearly-csv PATH Write yearly farm metrics as CSV\n";
  std::cout << "  --days N          Only simulate the first N days (no year-end rollup)\n";
  std::cout << "  --strict-plantings  Treat seasons without yield data as errors\n";
  std::cout << "  --validate-only   Load and validate the scenario, then exit\n";
  std::cout << "  --log-level LVL   debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet           Suppress the summary table\n";
  std::cout << "  -h, --help        Show this help\n";
  std::cout << "  --version         Print version and exit\n";
}

void print_summary(const agripv::SimulationState& st) {
  using agripv::format_fixed;

  std::cout << "\nDays simulated: " << st.days_simulated << "\n";
  std::cout << "\nYear  Farm              GW m3        Muni m3      Water USD    Yield kg     Revenue USD\n";
  for (const auto& m : st.yearly_farm_metrics) {
    std::string farm = m.farm_id;
    if (farm.size() < 16) farm.append(16 - farm.size(), ' ');
    std::cout << m.year << "  " << farm << "  " << format_fixed(m.totals.groundwater_m3, 1) << "  "
              << format_fixed(m.totals.municipal_m3, 1) << "  " << format_fixed(m.totals.water_cost_usd, 2) << "  "
              << format_fixed(m.totals.yield_kg, 1) << "  " << format_fixed(m.totals.crop_revenue_usd, 2) << "\n";
  }

  for (const auto& e : st.yearly_energy_metrics) {
    std::cout << "\nEnergy " << e.year << ": demand " << format_fixed(e.totals.demand_kwh, 1) << " kWh, renewables "
              << format_fixed(e.totals.pv_kwh + e.totals.wind_kwh, 1) << " kWh, import "
              << format_fixed(e.totals.grid_import_kwh, 1) << " kWh, generator "
              << format_fixed(e.totals.generator_kwh, 1) << " kWh, self-sufficiency "
              << format_fixed(e.self_sufficiency_pct, 1) << "%\n";
  }

  const auto& econ = st.economics;
  std::cout << "\nCash reserves:        " << format_fixed(econ.cash_reserves_usd, 2) << " USD\n";
  std::cout << "Revenue:              " << format_fixed(econ.total_revenue_usd, 2) << " USD\n";
  std::cout << "Operating cost:       " << format_fixed(econ.total_operating_cost_usd, 2) << " USD\n";
  std::cout << "Infrastructure cost:  " << format_fixed(econ.total_infrastructure_cost_usd, 2) << " USD\n";
  std::cout << "Aquifer extraction:   " << format_fixed(st.aquifer.cumulative_extraction_m3(), 1) << " m3\n";

  if (!st.skipped_plantings.empty()) {
    std::cout << "\nSkipped plantings (no yield data): " << st.skipped_plantings.size() << "\n";
    for (const auto& s : st.skipped_plantings) std::cout << "  - " << s << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << AGRIPV_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string log_level = get_str_arg(argc, argv, "--log-level", "info");
    agripv::log::Level lvl;
    if (!agripv::log::parse_level(log_level, &lvl)) {
      std::cerr << "Unknown --log-level: '" << log_level << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    agripv::log::set_level(lvl);

    const std::string scenario_path = get_str_arg(argc, argv, "--scenario", "");
    const std::string data_path = get_str_arg(argc, argv, "--data", "");
    const std::string out_path = get_str_arg(argc, argv, "--out", "");
    const std::string water_csv_path = get_str_arg(argc, argv, "--water-csv", "");
    const std::string energy_csv_path = get_str_arg(argc, argv, "--energy-csv", "");
    const std::string yearly_csv_path = get_str_arg(argc, argv, "--yearly-csv", "");
    const int days = get_int_arg(argc, argv, "--days", -1);

    const bool daily = has_flag(argc, argv, "--daily");
    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool validate_only = has_flag(argc, argv, "--validate-only");

    if (scenario_path.empty()) {
      std::cerr << "--scenario is required\n\n";
      print_usage(argv[0]);
      return 2;
    }

    agripv::Scenario scenario = agripv::load_scenario_file(scenario_path);

    if (validate_only) {
      const auto errors = agripv::validate_scenario(scenario);
      if (!errors.empty()) {
        std::cerr << "Scenario validation failed:\n";
        for (const auto& e : errors) std::cerr << "  - " << e << "\n";
        return 1;
      }
      if (!quiet) std::cout << "Scenario OK\n";
      return 0;
    }

    if (data_path.empty()) {
      std::cerr << "--data is required\n\n";
      print_usage(argv[0]);
      return 2;
    }

    agripv::SimConfig cfg;
    cfg.strict_plantings = has_flag(argc, argv, "--strict-plantings");

    agripv::Simulation sim(std::move(scenario), agripv::load_data_tables_file(data_path), cfg);
    if (days >= 0) {
      const int ran = sim.advance_days(days);
      agripv::log::info("Advanced " + std::to_string(ran) + " day(s)");
    } else {
      sim.run();
    }

    const auto& st = sim.state();
    if (!quiet) print_summary(st);

    if (!out_path.empty()) {
      agripv::write_text_file(out_path, agripv::results_to_json(sim, daily));
      if (!quiet) std::cout << "\nWrote results to " << out_path << "\n";
    }
    if (!water_csv_path.empty()) {
      agripv::write_text_file(water_csv_path, agripv::daily_water_to_csv(st));
      if (!quiet) std::cout << "Wrote water ledger to " << water_csv_path << "\n";
    }
    if (!energy_csv_path.empty()) {
      agripv::write_text_file(energy_csv_path, agripv::daily_energy_to_csv(st));
      if (!quiet) std::cout << "Wrote energy dispatch to " << energy_csv_path << "\n";
    }
    if (!yearly_csv_path.empty()) {
      agripv::write_text_file(yearly_csv_path, agripv::yearly_farm_metrics_to_csv(st));
      if (!quiet) std::cout << "Wrote yearly metrics to " << yearly_csv_path << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    agripv::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
