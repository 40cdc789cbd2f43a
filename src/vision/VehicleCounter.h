#pragma once
#include <stdint.h>

#include "control/LaneScheduler.h"

/*
  VehicleCounter

  The vision side as the controller sees it: one non-negative count per
  lane per tick. Whatever sits behind it (camera, background subtraction,
  a replay file) is outside the controller.
*/

class VehicleCounter {
public:
  virtual ~VehicleCounter() {}

  virtual uint16_t countVehicles(uint8_t lane) = 0;
};

// Asks every lane once and returns the snapshot the scheduler works on.
inline LaneCounts collectCounts(VehicleCounter& counter, uint8_t num_lanes) {
  LaneCounts c;
  c.num_lanes = (num_lanes > MAX_LANES) ? MAX_LANES : num_lanes;
  for (uint8_t lane = 0; lane < c.num_lanes; ++lane) {
    c.count[lane] = counter.countVehicles(lane);
  }
  return c;
}
