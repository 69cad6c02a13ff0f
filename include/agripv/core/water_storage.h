#pragma once

#include <vector>

#include "agripv/core/date.h"

namespace agripv {

struct DailyStorageRecord {
  Date date;
  double level_m3{0.0};
  double inflow_m3{0.0};
  double outflow_m3{0.0};
  double irrigation_out_m3{0.0};
  double household_out_m3{0.0};
  double building_out_m3{0.0};
  double utilization_pct{0.0};
};

// Treated-water buffer between the treatment plant and the distribution network.
// Today's supply is pushed through it (inflow == outflow), so it only changes level
// when a flow is clipped.
class WaterStorageState {
 public:
  WaterStorageState() = default;
  WaterStorageState(double capacity_m3, double initial_fraction);

  // Returns the volume accepted (clipped to the free room).
  double add_inflow(double volume_m3);

  // Returns the volume delivered (clipped to the current level).
  double draw_outflow(double volume_m3);

  void record_daily(Date date, double inflow_m3, double outflow_m3, double irrigation_m3, double household_m3,
                    double building_m3);

  double capacity_m3() const { return capacity_m3_; }
  double level_m3() const { return level_m3_; }
  double utilization_pct() const { return capacity_m3_ > 0.0 ? level_m3_ / capacity_m3_ * 100.0 : 0.0; }

  const std::vector<DailyStorageRecord>& daily_records() const { return records_; }

 private:
  double capacity_m3_{0.0};
  double level_m3_{0.0};
  std::vector<DailyStorageRecord> records_;
};

} // namespace agripv
