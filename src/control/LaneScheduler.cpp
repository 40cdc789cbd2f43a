#include "control/LaneScheduler.h"

#include <algorithm>

int Schedule::indexOf(uint8_t lane) const {
  for (uint8_t i = 0; i < size; ++i) {
    if (lanes[i] == lane) return i;
  }
  return -1;
}

uint16_t LaneScheduler::clampDuration(uint16_t seconds) const {
  const uint16_t lo = std::max(_params.min_s, GREEN_FLOOR_S);
  const uint16_t hi = std::max(_params.max_s, lo);
  if (seconds < lo) return lo;
  if (seconds > hi) return hi;
  return seconds;
}

Schedule LaneScheduler::schedule(const LaneCounts& counts) const {
  Schedule s;

  const uint8_t n = (counts.num_lanes > MAX_LANES) ? MAX_LANES : counts.num_lanes;
  for (uint8_t lane = 0; lane < n; ++lane) {
    if (counts.count[lane] > 0) {
      s.lanes[s.size++] = lane;
    }
  }

  if (s.empty()) return s;

  // Busiest first; lower id wins ties. Keys are unique so the order is total.
  std::sort(s.lanes, s.lanes + s.size, [&counts](uint8_t a, uint8_t b) {
    if (counts.count[a] != counts.count[b]) return counts.count[a] > counts.count[b];
    return a < b;
  });

  for (uint8_t i = 0; i < s.size; ++i) {
    uint16_t d;
    if (i == 0) {
      d = _params.first_s;
    } else if (i == s.size - 1) {
      d = _params.last_s;
    } else {
      d = _params.interior_s;
    }
    s.duration_s[s.lanes[i]] = clampDuration(d);
  }

  return s;
}
