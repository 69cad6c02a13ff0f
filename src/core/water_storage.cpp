#include "agripv/core/water_storage.h"

#include <algorithm>
#include <stdexcept>

namespace agripv {

WaterStorageState::WaterStorageState(double capacity_m3, double initial_fraction)
    : capacity_m3_(std::max(0.0, capacity_m3)),
      level_m3_(std::max(0.0, capacity_m3) * std::clamp(initial_fraction, 0.0, 1.0)) {}

double WaterStorageState::add_inflow(double volume_m3) {
  if (volume_m3 < 0.0) throw std::invalid_argument("storage inflow must be >= 0");
  const double accepted = std::min(volume_m3, capacity_m3_ - level_m3_);
  level_m3_ += accepted;
  return accepted;
}

double WaterStorageState::draw_outflow(double volume_m3) {
  if (volume_m3 < 0.0) throw std::invalid_argument("storage outflow must be >= 0");
  const double delivered = std::min(volume_m3, level_m3_);
  level_m3_ -= delivered;
  return delivered;
}

void WaterStorageState::record_daily(Date date, double inflow_m3, double outflow_m3, double irrigation_m3,
                                     double household_m3, double building_m3) {
  DailyStorageRecord r;
  r.date = date;
  r.level_m3 = level_m3_;
  r.inflow_m3 = inflow_m3;
  r.outflow_m3 = outflow_m3;
  r.irrigation_out_m3 = irrigation_m3;
  r.household_out_m3 = household_m3;
  r.building_out_m3 = building_m3;
  r.utilization_pct = utilization_pct();
  records_.push_back(r);
}

} // namespace agripv
