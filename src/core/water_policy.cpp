#include "agripv/core/water_policy.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "agripv/util/strings.h"

namespace agripv {

const char* water_policy_kind_id(WaterPolicyKind k) {
  switch (k) {
    case WaterPolicyKind::AlwaysGroundwater: return "always_groundwater";
    case WaterPolicyKind::AlwaysMunicipal: return "always_municipal";
    case WaterPolicyKind::CheapestSource: return "cheapest_source";
    case WaterPolicyKind::ConserveGroundwater: return "conserve_groundwater";
    case WaterPolicyKind::QuotaEnforced: return "quota_enforced";
  }
  return "cheapest_source";
}

bool water_policy_kind_from_string(std::string_view s, WaterPolicyKind* out) {
  static constexpr WaterPolicyKind kAll[] = {
      WaterPolicyKind::AlwaysGroundwater,   WaterPolicyKind::AlwaysMunicipal, WaterPolicyKind::CheapestSource,
      WaterPolicyKind::ConserveGroundwater, WaterPolicyKind::QuotaEnforced,
  };
  const std::string v = to_lower(trim(std::string(s)));
  for (const WaterPolicyKind k : kAll) {
    if (v == water_policy_kind_id(k)) {
      if (out) *out = k;
      return true;
    }
  }
  return false;
}

const char* binding_constraint_id(BindingConstraint c) {
  switch (c) {
    case BindingConstraint::None: return "";
    case BindingConstraint::Energy: return "energy_limit";
    case BindingConstraint::Well: return "well_limit";
    case BindingConstraint::Treatment: return "treatment_limit";
  }
  return "";
}

std::string decision_reason_label(DecisionReason r, BindingConstraint c) {
  std::string base;
  switch (r) {
    case DecisionReason::GwPreferred: base = "gw_preferred"; break;
    case DecisionReason::GwPreferredPartial: base = "gw_preferred_partial"; break;
    case DecisionReason::MuniOnly: base = "muni_only"; break;
    case DecisionReason::GwCheaper: base = "gw_cheaper"; break;
    case DecisionReason::MuniCheaper: base = "muni_cheaper"; break;
    case DecisionReason::ThresholdExceeded: base = "threshold_exceeded"; break;
    case DecisionReason::ThresholdNotMet: base = "threshold_not_met"; break;
    case DecisionReason::QuotaExhausted: base = "quota_exhausted"; break;
    case DecisionReason::QuotaMonthlyLimit: base = "quota_monthly_limit"; break;
    case DecisionReason::QuotaAvailable: base = "quota_available"; break;
    case DecisionReason::QuotaAvailablePartial: base = "quota_available_partial"; break;
  }
  if (c != BindingConstraint::None) base += std::string("_but_") + binding_constraint_id(c);
  return base;
}

double groundwater_kwh_per_m3(const WaterPolicyContext& ctx) {
  return ctx.pumping_kwh_per_m3 + ctx.conveyance_kwh_per_m3 + ctx.treatment_kwh_per_m3;
}

double groundwater_cost_per_m3(const WaterPolicyContext& ctx) {
  return groundwater_kwh_per_m3(ctx) * ctx.energy_price_usd_per_kwh + ctx.gw_maintenance_usd_per_m3;
}

ConstrainedVolume apply_physical_constraints(double requested_m3, const WaterPolicyContext& ctx) {
  const double kwh_per_m3 = groundwater_kwh_per_m3(ctx);
  const double by_energy =
      kwh_per_m3 > 0.0 ? ctx.available_energy_kwh / kwh_per_m3 : std::numeric_limits<double>::infinity();

  // Ties keep the earlier entry, so the order here decides which bound gets reported.
  ConstrainedVolume out{requested_m3, BindingConstraint::None};
  const std::pair<double, BindingConstraint> limits[] = {
      {by_energy, BindingConstraint::Energy},
      {ctx.max_groundwater_m3, BindingConstraint::Well},
      {ctx.max_treatment_m3, BindingConstraint::Treatment},
  };
  for (const auto& [limit, which] : limits) {
    if (limit < out.volume_m3) {
      out.volume_m3 = limit;
      out.binding = which;
    }
  }
  out.volume_m3 = std::max(0.0, out.volume_m3);
  if (out.volume_m3 >= requested_m3) out.binding = BindingConstraint::None;
  return out;
}

WaterAllocation WaterPolicy::finish(const WaterPolicyContext& ctx, double gw_m3, DecisionReason reason,
                                    BindingConstraint constraint) {
  WaterAllocation a;
  a.groundwater_m3 = gw_m3;
  a.municipal_m3 = std::max(0.0, ctx.demand_m3 - gw_m3);
  a.gw_cost_per_m3 = groundwater_cost_per_m3(ctx);
  a.muni_cost_per_m3 = ctx.municipal_price_usd_per_m3;
  a.energy_used_kwh = gw_m3 * groundwater_kwh_per_m3(ctx);
  a.cost_usd = gw_m3 * a.gw_cost_per_m3 + a.municipal_m3 * a.muni_cost_per_m3;
  a.reason = reason;
  a.constraint = constraint;
  return a;
}

WaterAllocation AlwaysGroundwaterPolicy::allocate(const WaterPolicyContext& ctx) const {
  const ConstrainedVolume gw = apply_physical_constraints(ctx.demand_m3, ctx);
  DecisionReason reason = DecisionReason::GwPreferred;
  if (gw.binding == BindingConstraint::None && gw.volume_m3 < ctx.demand_m3) {
    reason = DecisionReason::GwPreferredPartial;
  }
  return finish(ctx, gw.volume_m3, reason, gw.binding);
}

std::string AlwaysGroundwaterPolicy::describe() const {
  return "always_groundwater: 100% groundwater, municipal only when capacity or energy runs out";
}

WaterAllocation AlwaysMunicipalPolicy::allocate(const WaterPolicyContext& ctx) const {
  return finish(ctx, 0.0, DecisionReason::MuniOnly, BindingConstraint::None);
}

std::string AlwaysMunicipalPolicy::describe() const { return "always_municipal: 100% municipal water"; }

WaterAllocation CheapestSourcePolicy::allocate(const WaterPolicyContext& ctx) const {
  const double compared_gw_cost =
      include_energy_cost_ ? groundwater_cost_per_m3(ctx) : ctx.gw_maintenance_usd_per_m3;
  if (compared_gw_cost < ctx.municipal_price_usd_per_m3) {
    const ConstrainedVolume gw = apply_physical_constraints(ctx.demand_m3, ctx);
    return finish(ctx, gw.volume_m3, DecisionReason::GwCheaper, gw.binding);
  }
  return finish(ctx, 0.0, DecisionReason::MuniCheaper, BindingConstraint::None);
}

std::string CheapestSourcePolicy::describe() const {
  return std::string("cheapest_source: compare groundwater vs municipal cost daily") +
         (include_energy_cost_ ? " (energy included)" : " (O&M only)");
}

ConserveGroundwaterPolicy::ConserveGroundwaterPolicy(double price_threshold_multiplier, double max_gw_ratio)
    : multiplier_(price_threshold_multiplier), max_ratio_(max_gw_ratio) {
  if (!(multiplier_ > 0.0)) throw std::invalid_argument("conserve_groundwater: price_threshold_multiplier must be > 0");
  if (max_ratio_ < 0.0 || max_ratio_ > 1.0) {
    throw std::invalid_argument("conserve_groundwater: max_gw_ratio must be in [0, 1]");
  }
}

WaterAllocation ConserveGroundwaterPolicy::allocate(const WaterPolicyContext& ctx) const {
  if (ctx.municipal_price_usd_per_m3 > groundwater_cost_per_m3(ctx) * multiplier_) {
    const ConstrainedVolume gw = apply_physical_constraints(ctx.demand_m3 * max_ratio_, ctx);
    WaterAllocation a = finish(ctx, gw.volume_m3, DecisionReason::ThresholdExceeded, gw.binding);
    a.limiting_factor = gw.binding == BindingConstraint::None ? "ratio_cap" : binding_constraint_id(gw.binding);
    return a;
  }
  return finish(ctx, 0.0, DecisionReason::ThresholdNotMet, BindingConstraint::None);
}

std::string ConserveGroundwaterPolicy::describe() const {
  return "conserve_groundwater: municipal unless it costs more than " + format_fixed(multiplier_, 2) +
         "x groundwater, then at most " + format_fixed(max_ratio_ * 100.0, 0) + "% groundwater";
}

QuotaEnforcedPolicy::QuotaEnforcedPolicy(double annual_quota_m3, double monthly_variance_pct)
    : annual_quota_(annual_quota_m3), variance_(monthly_variance_pct) {
  if (annual_quota_ < 0.0) throw std::invalid_argument("quota_enforced: annual_quota_m3 must be >= 0");
  if (variance_ < 0.0) throw std::invalid_argument("quota_enforced: monthly_variance_pct must be >= 0");
}

WaterAllocation QuotaEnforcedPolicy::allocate(const WaterPolicyContext& ctx) const {
  const double remaining_annual = std::max(0.0, annual_quota_ - ctx.groundwater_used_this_year_m3);
  const double remaining_monthly = std::max(0.0, monthly_max_m3() - ctx.groundwater_used_this_month_m3);

  if (remaining_annual <= 0.0) return finish(ctx, 0.0, DecisionReason::QuotaExhausted, BindingConstraint::None);
  if (remaining_monthly <= 0.0) {
    return finish(ctx, 0.0, DecisionReason::QuotaMonthlyLimit, BindingConstraint::None);
  }

  const double requested = std::min(ctx.demand_m3, std::min(remaining_annual, remaining_monthly));
  const ConstrainedVolume gw = apply_physical_constraints(requested, ctx);
  DecisionReason reason = DecisionReason::QuotaAvailable;
  if (gw.binding == BindingConstraint::None && gw.volume_m3 < ctx.demand_m3) {
    reason = DecisionReason::QuotaAvailablePartial;
  }
  return finish(ctx, gw.volume_m3, reason, gw.binding);
}

std::string QuotaEnforcedPolicy::describe() const {
  return "quota_enforced: " + format_fixed(annual_quota_, 0) + " m3/year, at most " + format_fixed(monthly_max_m3(), 0) +
         " m3/month";
}

std::unique_ptr<WaterPolicy> make_water_policy(const std::string& name, const WaterPolicyParams& params) {
  WaterPolicyKind kind;
  if (!water_policy_kind_from_string(name, &kind)) {
    throw std::invalid_argument("Unknown water policy '" + name +
                                "'. Valid: always_groundwater, always_municipal, cheapest_source, "
                                "conserve_groundwater, quota_enforced");
  }
  switch (kind) {
    case WaterPolicyKind::AlwaysGroundwater: return std::make_unique<AlwaysGroundwaterPolicy>();
    case WaterPolicyKind::AlwaysMunicipal: return std::make_unique<AlwaysMunicipalPolicy>();
    case WaterPolicyKind::CheapestSource: return std::make_unique<CheapestSourcePolicy>(params.include_energy_cost);
    case WaterPolicyKind::ConserveGroundwater:
      return std::make_unique<ConserveGroundwaterPolicy>(params.price_threshold_multiplier, params.max_gw_ratio);
    case WaterPolicyKind::QuotaEnforced:
      return std::make_unique<QuotaEnforcedPolicy>(params.annual_quota_m3, params.monthly_variance_pct);
  }
  throw std::invalid_argument("Unhandled water policy: " + name);
}

} // namespace agripv
