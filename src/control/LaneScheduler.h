#pragma once
#include <stdint.h>

#include "Params.h"

/*
===============================================================================
  LaneScheduler.h
===============================================================================

  PURPOSE
  -------
  Turns one snapshot of per-lane vehicle counts into:

    - the activation cycle: lanes with count > 0, busiest first,
      lower lane id first on ties
    - a green duration for every lane in that cycle, by position:
        n = 1  -> FIRST
        n = 2  -> FIRST, LAST
        n >= 3 -> FIRST, INTERIOR..., LAST

  Durations are clamped to [max(min_s, GREEN_FLOOR_S), max_s].

  Pure: no I/O, no clock, same input -> same output.
===============================================================================
*/

struct LaneCounts {
  uint8_t num_lanes = 0;
  uint16_t count[MAX_LANES] = {};
};

struct Schedule {
  uint8_t size = 0;
  uint8_t lanes[MAX_LANES] = {};        // priority order
  uint16_t duration_s[MAX_LANES] = {};  // indexed by lane id; 0 if not in cycle

  bool empty() const { return size == 0; }

  // Position of lane in the cycle, or -1
  int indexOf(uint8_t lane) const;
  bool contains(uint8_t lane) const { return indexOf(lane) >= 0; }
};

class LaneScheduler {
public:
  struct DurationParams {
    uint16_t first_s = GREEN_FIRST_S;
    uint16_t interior_s = GREEN_INTERIOR_S;
    uint16_t last_s = GREEN_LAST_S;
    uint16_t min_s = GREEN_MIN_S;
    uint16_t max_s = GREEN_MAX_S;
  };

  LaneScheduler() {}
  explicit LaneScheduler(const DurationParams& params) : _params(params) {}

  Schedule schedule(const LaneCounts& counts) const;

  // Applies the floor and the configured bounds
  uint16_t clampDuration(uint16_t seconds) const;

  const DurationParams& params() const { return _params; }

private:
  DurationParams _params;
};
