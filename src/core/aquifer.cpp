#include "agripv/core/aquifer.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace agripv {
namespace {

constexpr double kWaterDensity = 1025.0;  // kg/m3, brackish
constexpr double kGravity = 9.81;
constexpr double kFrictionFactor = 0.02;  // PVC
constexpr double kJoulesPerKwh = 3.6e6;
constexpr double kPi = 3.14159265358979323846;

} // namespace

AquiferState::AquiferState(const AquiferConfig& cfg)
    : exploitable_m3_(cfg.exploitable_volume_m3),
      recharge_m3_yr_(cfg.recharge_rate_m3_yr),
      max_drawdown_m_(cfg.max_drawdown_m) {}

void AquiferState::record_extraction(double volume_m3) {
  if (volume_m3 < 0.0) throw std::invalid_argument("aquifer extraction must be >= 0");
  cumulative_m3_ += volume_m3;
}

double AquiferState::net_depletion_m3(double years_elapsed) const {
  return std::max(0.0, cumulative_m3_ - recharge_m3_yr_ * years_elapsed);
}

double AquiferState::years_remaining(double years_elapsed) const {
  constexpr double kInf = std::numeric_limits<double>::infinity();
  if (years_elapsed <= 0.0) return kInf;
  const double net_rate = cumulative_m3_ / years_elapsed - recharge_m3_yr_;
  if (net_rate <= 0.0) return kInf;
  const double remaining = exploitable_m3_ - net_depletion_m3(years_elapsed);
  if (remaining <= 0.0) return 0.0;
  return remaining / net_rate;
}

double AquiferState::drawdown_m() const {
  if (exploitable_m3_ <= 0.0 || max_drawdown_m_ <= 0.0) return 0.0;
  return max_drawdown_m_ * std::min(1.0, cumulative_m3_ / exploitable_m3_);
}

double AquiferState::effective_head_m(double base_depth_m) const { return base_depth_m + drawdown_m(); }

PumpingEnergy pumping_energy(const WellConfig& wells, double head_m) {
  if (!(wells.pump_efficiency > 0.0)) throw std::invalid_argument("pump efficiency must be > 0");
  if (!(wells.pipe_diameter_m > 0.0)) throw std::invalid_argument("pipe diameter must be > 0");

  const double per_head_m = kWaterDensity * kGravity / (wells.pump_efficiency * kJoulesPerKwh);

  const double area_m2 = kPi * std::pow(wells.pipe_diameter_m / 2.0, 2);
  const double velocity_m_s = (wells.well_flow_rate_m3_day / 86400.0) / area_m2;
  const double run_m = wells.pipe_distance_km * 1000.0;

  PumpingEnergy out;
  out.friction_head_m =
      kFrictionFactor * (run_m / wells.pipe_diameter_m) * (velocity_m_s * velocity_m_s / (2.0 * kGravity));
  out.lift_kwh_per_m3 = per_head_m * head_m;
  out.friction_kwh_per_m3 = per_head_m * out.friction_head_m;
  return out;
}

} // namespace agripv
