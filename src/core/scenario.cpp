#include "agripv/core/scenario.h"

#include "agripv/util/strings.h"

namespace agripv {
namespace {

template <typename E, std::size_t N>
bool lookup_id(std::string_view s, const std::array<E, N>& all, const char* (*id)(E), E* out) {
  const std::string needle = to_lower(trim(std::string(s)));
  for (const E e : all) {
    if (needle == id(e)) {
      if (out) *out = e;
      return true;
    }
  }
  return false;
}

} // namespace

const char* pricing_regime_id(PricingRegime r) {
  switch (r) {
    case PricingRegime::Subsidized: return "subsidized";
    case PricingRegime::Unsubsidized: return "unsubsidized";
  }
  return "subsidized";
}

bool pricing_regime_from_string(std::string_view s, PricingRegime* out) {
  static constexpr std::array<PricingRegime, 2> kAll = {PricingRegime::Subsidized, PricingRegime::Unsubsidized};
  return lookup_id(s, kAll, &pricing_regime_id, out);
}

const char* subsystem_id(Subsystem s) {
  switch (s) {
    case Subsystem::Wells: return "wells";
    case Subsystem::WaterTreatment: return "water_treatment";
    case Subsystem::IrrigationStorage: return "irrigation_storage";
    case Subsystem::IrrigationSystem: return "irrigation_system";
    case Subsystem::Pv: return "pv";
    case Subsystem::Wind: return "wind";
    case Subsystem::Battery: return "battery";
    case Subsystem::Generator: return "generator";
  }
  return "wells";
}

bool subsystem_from_string(std::string_view s, Subsystem* out) {
  return lookup_id(s, kAllSubsystems, &subsystem_id, out);
}

const char* financing_status_id(FinancingStatus f) {
  switch (f) {
    case FinancingStatus::ExistingOwned: return "existing_owned";
    case FinancingStatus::GrantFull: return "grant_full";
    case FinancingStatus::GrantCapex: return "grant_capex";
    case FinancingStatus::PurchasedCash: return "purchased_cash";
    case FinancingStatus::LoanStandard: return "loan_standard";
    case FinancingStatus::LoanConcessional: return "loan_concessional";
  }
  return "existing_owned";
}

bool financing_status_from_string(std::string_view s, FinancingStatus* out) {
  static constexpr std::array<FinancingStatus, 6> kAll = {
      FinancingStatus::ExistingOwned, FinancingStatus::GrantFull,    FinancingStatus::GrantCapex,
      FinancingStatus::PurchasedCash, FinancingStatus::LoanStandard, FinancingStatus::LoanConcessional,
  };
  return lookup_id(s, kAll, &financing_status_id, out);
}

double Scenario::total_farm_area_ha() const {
  double total = 0.0;
  for (const auto& f : farms) total += f.area_ha;
  return total;
}

} // namespace agripv
