#pragma once

#include "agripv/core/scenario.h"

namespace agripv {

// Long-run groundwater balance for the community's aquifer.
//
// Cumulative extraction only ever grows. Depletion raises the pumping head linearly
// up to max_drawdown_m once the full exploitable volume has been drawn, and the
// pumping energy is re-derived from that head whenever a policy needs it.
class AquiferState {
 public:
  AquiferState() = default;
  explicit AquiferState(const AquiferConfig& cfg);

  // Throws std::invalid_argument for a negative volume.
  void record_extraction(double volume_m3);

  double cumulative_extraction_m3() const { return cumulative_m3_; }
  double exploitable_volume_m3() const { return exploitable_m3_; }
  double recharge_rate_m3_yr() const { return recharge_m3_yr_; }
  double max_drawdown_m() const { return max_drawdown_m_; }

  // Extraction not replaced by recharge over `years_elapsed`, never negative.
  double net_depletion_m3(double years_elapsed) const;

  // Years until the exploitable volume is gone at the average net rate so far.
  // +inf when nothing has elapsed or recharge keeps up; 0 when already exhausted.
  double years_remaining(double years_elapsed) const;

  // Extra head from depletion, 0..max_drawdown_m.
  double drawdown_m() const;

  // Static well depth plus current drawdown.
  double effective_head_m(double base_depth_m) const;

 private:
  double exploitable_m3_{0.0};
  double recharge_m3_yr_{0.0};
  double max_drawdown_m_{0.0};
  double cumulative_m3_{0.0};
};

struct PumpingEnergy {
  double lift_kwh_per_m3{0.0};
  double friction_kwh_per_m3{0.0};
  double friction_head_m{0.0};

  double total_kwh_per_m3() const { return lift_kwh_per_m3 + friction_kwh_per_m3; }
};

// Lift from `head_m` plus Darcy-Weisbach friction over the horizontal pipe run, for
// brackish water (1025 kg/m3) at one well's flow rate.
PumpingEnergy pumping_energy(const WellConfig& wells, double head_m);

} // namespace agripv
