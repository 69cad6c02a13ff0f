#pragma once

#include <vector>

#include "agripv/core/scenario.h"

namespace agripv {

// How a financing status turns capital and O&M into yearly cost.
struct FinancingProfile {
  // Share of capital paid up front and depreciated straight-line.
  double capex_multiplier{0.0};
  bool has_debt_service{false};
  int loan_term_years{0};
  double annual_interest_rate{0.0};
  double opex_multiplier{1.0};
};

const FinancingProfile& financing_profile(FinancingStatus status);

// Fixed-rate amortized monthly payment, P r (1+r)^n / ((1+r)^n - 1) with r the monthly
// rate and n the number of months. A zero rate repays P / n.
double monthly_loan_payment(double principal_usd, double annual_rate, int term_years);

struct SubsystemCost {
  Subsystem subsystem{Subsystem::Wells};
  FinancingStatus status{FinancingStatus::ExistingOwned};
  double capital_usd{0.0};
  double annual_om_usd{0.0};

  // Either annual debt service (loans) or annual depreciation (cash purchases).
  double annual_capex_usd{0.0};
  double annual_debt_service_usd{0.0};
  double annual_opex_usd{0.0};

  double annual_total_usd() const { return annual_capex_usd + annual_opex_usd; }
};

// Capital and O&M of one subsystem sized from the scenario and its reference costs.
SubsystemCost size_subsystem(const Scenario& sc, Subsystem s);

// Applies the financing profile to a sized subsystem.
void apply_financing(SubsystemCost& c, int depreciation_years);

std::vector<SubsystemCost> infrastructure_costs(const Scenario& sc, int depreciation_years);

struct EconomicState {
  double cash_reserves_usd{0.0};
  double total_revenue_usd{0.0};
  double total_operating_cost_usd{0.0};
  double total_infrastructure_cost_usd{0.0};
  double total_debt_service_usd{0.0};

  double annual_infrastructure_cost_usd{0.0};
  double annual_debt_service_usd{0.0};
  std::vector<SubsystemCost> subsystems;

  int years_rolled{0};
};

// Starting cash is the farms' combined starting capital.
EconomicState make_economic_state(const Scenario& sc, int depreciation_years);

// Daily community costs outside farm water bills (domestic utilities, diesel, fertilizer).
void add_operating_cost(EconomicState& e, double usd);

// Year-end rollup of farm revenue and water cost plus one year of infrastructure cost.
void roll_economic_year(EconomicState& e, double crop_revenue_usd, double water_cost_usd);

} // namespace agripv
