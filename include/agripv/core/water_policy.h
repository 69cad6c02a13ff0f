#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "agripv/core/scenario.h"

namespace agripv {

// --- irrigation water allocation ---
//
// Once per farm per day a policy splits the farm's irrigation demand between
// treated groundwater and municipal supply. Policies are stateless; everything they
// need (prices, energy, capacity share, quota usage) arrives in the context.

enum class WaterPolicyKind : std::uint8_t {
  AlwaysGroundwater = 0,
  AlwaysMunicipal,
  CheapestSource,
  ConserveGroundwater,
  QuotaEnforced,
};

const char* water_policy_kind_id(WaterPolicyKind k);
bool water_policy_kind_from_string(std::string_view s, WaterPolicyKind* out);

struct WaterPolicyContext {
  double demand_m3{0.0};

  // Energy the community can spend on groundwater today. Infinity = unconstrained.
  double available_energy_kwh{std::numeric_limits<double>::infinity()};

  double energy_price_usd_per_kwh{0.0};
  double municipal_price_usd_per_m3{0.0};

  double pumping_kwh_per_m3{0.0};
  double conveyance_kwh_per_m3{0.2};
  double treatment_kwh_per_m3{0.0};
  double gw_maintenance_usd_per_m3{0.05};

  double groundwater_used_this_month_m3{0.0};
  double groundwater_used_this_year_m3{0.0};
  int current_month{1};

  // This farm's share of well and treatment throughput for the day.
  double max_groundwater_m3{std::numeric_limits<double>::infinity()};
  double max_treatment_m3{std::numeric_limits<double>::infinity()};
};

// Why the decision came out as it did; combined with BindingConstraint into the
// audit tag (e.g. "gw_cheaper_but_well_limit").
enum class DecisionReason : std::uint8_t {
  GwPreferred = 0,
  GwPreferredPartial,
  MuniOnly,
  GwCheaper,
  MuniCheaper,
  ThresholdExceeded,
  ThresholdNotMet,
  QuotaExhausted,
  QuotaMonthlyLimit,
  QuotaAvailable,
  QuotaAvailablePartial,
};

enum class BindingConstraint : std::uint8_t {
  None = 0,
  Energy,
  Well,
  Treatment,
};

const char* binding_constraint_id(BindingConstraint c);  // "" for None
std::string decision_reason_label(DecisionReason r, BindingConstraint c);

struct WaterAllocation {
  double groundwater_m3{0.0};
  double municipal_m3{0.0};
  double energy_used_kwh{0.0};
  double cost_usd{0.0};

  DecisionReason reason{DecisionReason::MuniOnly};
  BindingConstraint constraint{BindingConstraint::None};
  // What capped groundwater when it was not a physical constraint ("ratio_cap"), else "".
  std::string limiting_factor;

  double gw_cost_per_m3{0.0};
  double muni_cost_per_m3{0.0};

  double total_m3() const { return groundwater_m3 + municipal_m3; }
  std::string reason_label() const { return decision_reason_label(reason, constraint); }
};

// Pumping + conveyance + treatment.
double groundwater_kwh_per_m3(const WaterPolicyContext& ctx);

// Energy cost plus O&M, per m3 of groundwater.
double groundwater_cost_per_m3(const WaterPolicyContext& ctx);

struct ConstrainedVolume {
  double volume_m3{0.0};
  // Set only when the constraint actually reduced the request.
  BindingConstraint binding{BindingConstraint::None};
};

// Clips a groundwater request to the tightest of energy-limited volume, well capacity
// and treatment capacity. A non-positive energy intensity never limits.
ConstrainedVolume apply_physical_constraints(double requested_m3, const WaterPolicyContext& ctx);

class WaterPolicy {
 public:
  virtual ~WaterPolicy() = default;

  virtual WaterPolicyKind kind() const = 0;
  virtual WaterAllocation allocate(const WaterPolicyContext& ctx) const = 0;
  virtual std::string describe() const = 0;

  const char* id() const { return water_policy_kind_id(kind()); }

 protected:
  // Fills volumes, energy and cost from a final groundwater volume.
  static WaterAllocation finish(const WaterPolicyContext& ctx, double gw_m3, DecisionReason reason,
                                BindingConstraint constraint);
};

class AlwaysGroundwaterPolicy final : public WaterPolicy {
 public:
  WaterPolicyKind kind() const override { return WaterPolicyKind::AlwaysGroundwater; }
  WaterAllocation allocate(const WaterPolicyContext& ctx) const override;
  std::string describe() const override;
};

class AlwaysMunicipalPolicy final : public WaterPolicy {
 public:
  WaterPolicyKind kind() const override { return WaterPolicyKind::AlwaysMunicipal; }
  WaterAllocation allocate(const WaterPolicyContext& ctx) const override;
  std::string describe() const override;
};

// Uses groundwater whenever it is cheaper than municipal water.
//
// With include_energy_cost == false only the O&M component enters the comparison,
// but the allocation is always charged the full groundwater cost (energy included).
class CheapestSourcePolicy final : public WaterPolicy {
 public:
  explicit CheapestSourcePolicy(bool include_energy_cost = true) : include_energy_cost_(include_energy_cost) {}

  WaterPolicyKind kind() const override { return WaterPolicyKind::CheapestSource; }
  WaterAllocation allocate(const WaterPolicyContext& ctx) const override;
  std::string describe() const override;

 private:
  bool include_energy_cost_;
};

// Municipal by default. When municipal water costs more than
// price_threshold_multiplier x the groundwater cost, up to max_gw_ratio of the demand
// is drawn from the aquifer.
class ConserveGroundwaterPolicy final : public WaterPolicy {
 public:
  ConserveGroundwaterPolicy(double price_threshold_multiplier, double max_gw_ratio);

  WaterPolicyKind kind() const override { return WaterPolicyKind::ConserveGroundwater; }
  WaterAllocation allocate(const WaterPolicyContext& ctx) const override;
  std::string describe() const override;

 private:
  double multiplier_;
  double max_ratio_;
};

// Hard annual groundwater quota with a monthly ceiling of
// quota / 12 * (1 + monthly_variance_pct).
class QuotaEnforcedPolicy final : public WaterPolicy {
 public:
  QuotaEnforcedPolicy(double annual_quota_m3, double monthly_variance_pct);

  WaterPolicyKind kind() const override { return WaterPolicyKind::QuotaEnforced; }
  WaterAllocation allocate(const WaterPolicyContext& ctx) const override;
  std::string describe() const override;

  double monthly_max_m3() const { return annual_quota_ / 12.0 * (1.0 + variance_); }

 private:
  double annual_quota_;
  double variance_;
};

// Throws std::invalid_argument for an unknown name or out-of-range parameters.
std::unique_ptr<WaterPolicy> make_water_policy(const std::string& name, const WaterPolicyParams& params);

} // namespace agripv
