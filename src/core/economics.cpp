#include "agripv/core/economics.h"

#include <cmath>
#include <stdexcept>

namespace agripv {

const FinancingProfile& financing_profile(FinancingStatus status) {
  static const FinancingProfile kExistingOwned{0.0, false, 0, 0.0, 1.0};
  static const FinancingProfile kGrantFull{0.0, false, 0, 0.0, 0.0};
  static const FinancingProfile kGrantCapex{0.0, false, 0, 0.0, 1.0};
  static const FinancingProfile kPurchasedCash{1.0, false, 0, 0.0, 1.0};
  static const FinancingProfile kLoanStandard{0.0, true, 10, 0.060, 1.0};
  static const FinancingProfile kLoanConcessional{0.0, true, 15, 0.035, 1.0};
  switch (status) {
    case FinancingStatus::ExistingOwned: return kExistingOwned;
    case FinancingStatus::GrantFull: return kGrantFull;
    case FinancingStatus::GrantCapex: return kGrantCapex;
    case FinancingStatus::PurchasedCash: return kPurchasedCash;
    case FinancingStatus::LoanStandard: return kLoanStandard;
    case FinancingStatus::LoanConcessional: return kLoanConcessional;
  }
  return kExistingOwned;
}

double monthly_loan_payment(double principal_usd, double annual_rate, int term_years) {
  const int n = term_years * 12;
  if (n <= 0) return 0.0;
  const double r = annual_rate / 12.0;
  if (r <= 0.0) return principal_usd / n;
  const double growth = std::pow(1.0 + r, n);
  return principal_usd * (r * growth) / (growth - 1.0);
}

SubsystemCost size_subsystem(const Scenario& sc, Subsystem s) {
  const ReferenceCosts& rc = sc.reference_costs;
  SubsystemCost c;
  c.subsystem = s;
  c.status = sc.financing_for(s);
  switch (s) {
    case Subsystem::Wells:
      c.capital_usd = rc.well_capex_usd_per_m_depth * sc.wells.well_depth_m * sc.wells.number_of_wells;
      c.annual_om_usd = rc.well_om_usd_per_well_yr * sc.wells.number_of_wells;
      break;
    case Subsystem::WaterTreatment:
      c.capital_usd = rc.treatment_capex_usd_per_m3_day * sc.treatment.capacity_m3_day;
      c.annual_om_usd = c.capital_usd * rc.treatment_om_pct_of_capex / 100.0;
      break;
    case Subsystem::IrrigationStorage:
      c.capital_usd = rc.storage_capex_usd_per_m3 * sc.storage.capacity_m3;
      c.annual_om_usd = c.capital_usd * rc.storage_om_pct_of_capex / 100.0;
      break;
    case Subsystem::IrrigationSystem:
      c.capital_usd = rc.irrigation_capex_usd_per_ha * sc.total_farm_area_ha();
      c.annual_om_usd = c.capital_usd * rc.irrigation_om_pct_of_capex / 100.0;
      break;
    case Subsystem::Pv:
      c.capital_usd = rc.pv_capex_usd_per_kw * sc.pv.sys_capacity_kw;
      c.annual_om_usd = rc.pv_om_usd_per_kw_yr * sc.pv.sys_capacity_kw;
      break;
    case Subsystem::Wind:
      c.capital_usd = rc.wind_capex_usd_per_kw * sc.wind.sys_capacity_kw;
      c.annual_om_usd = rc.wind_om_usd_per_kw_yr * sc.wind.sys_capacity_kw;
      break;
    case Subsystem::Battery:
      c.capital_usd = rc.battery_capex_usd_per_kwh * sc.battery.capacity_kwh;
      c.annual_om_usd = c.capital_usd * rc.battery_om_pct_of_capex / 100.0;
      break;
    case Subsystem::Generator:
      c.capital_usd = rc.generator_capex_usd_per_kw * sc.generator.capacity_kw;
      c.annual_om_usd = rc.generator_om_usd_per_kw_yr * sc.generator.capacity_kw;
      break;
  }
  return c;
}

void apply_financing(SubsystemCost& c, int depreciation_years) {
  if (depreciation_years <= 0) throw std::invalid_argument("depreciation_years must be > 0");
  const FinancingProfile& p = financing_profile(c.status);
  c.annual_capex_usd = 0.0;
  c.annual_debt_service_usd = 0.0;
  if (p.has_debt_service) {
    c.annual_debt_service_usd = monthly_loan_payment(c.capital_usd, p.annual_interest_rate, p.loan_term_years) * 12.0;
    c.annual_capex_usd = c.annual_debt_service_usd;
  } else if (p.capex_multiplier > 0.0) {
    c.annual_capex_usd = c.capital_usd * p.capex_multiplier / depreciation_years;
  }
  c.annual_opex_usd = c.annual_om_usd * p.opex_multiplier;
}

std::vector<SubsystemCost> infrastructure_costs(const Scenario& sc, int depreciation_years) {
  std::vector<SubsystemCost> out;
  out.reserve(kSubsystemCount);
  for (const Subsystem s : kAllSubsystems) {
    SubsystemCost c = size_subsystem(sc, s);
    apply_financing(c, depreciation_years);
    out.push_back(c);
  }
  return out;
}

EconomicState make_economic_state(const Scenario& sc, int depreciation_years) {
  EconomicState e;
  for (const auto& f : sc.farms) e.cash_reserves_usd += f.starting_capital_usd;
  e.subsystems = infrastructure_costs(sc, depreciation_years);
  for (const auto& c : e.subsystems) {
    e.annual_infrastructure_cost_usd += c.annual_total_usd();
    e.annual_debt_service_usd += c.annual_debt_service_usd;
  }
  return e;
}

void add_operating_cost(EconomicState& e, double usd) {
  e.total_operating_cost_usd += usd;
  e.cash_reserves_usd -= usd;
}

void roll_economic_year(EconomicState& e, double crop_revenue_usd, double water_cost_usd) {
  e.total_revenue_usd += crop_revenue_usd;
  e.total_operating_cost_usd += water_cost_usd + e.annual_infrastructure_cost_usd;
  e.total_infrastructure_cost_usd += e.annual_infrastructure_cost_usd;
  e.total_debt_service_usd += e.annual_debt_service_usd;
  e.cash_reserves_usd += crop_revenue_usd - water_cost_usd - e.annual_infrastructure_cost_usd;
  ++e.years_rolled;
}

} // namespace agripv
