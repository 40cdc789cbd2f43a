#pragma once
#include <stdint.h>

#include "Params.h"

/*
  PhaseState

  What the controller believes each signal head is showing. This is the
  controller's own bookkeeping (open loop): nothing is read back from the
  board.

  Invariant: at most one lane is GREEN or YELLOW at any time.
*/

enum class LightPhase : uint8_t {
  NONE = 0,   // never commanded since startup
  GREEN,
  YELLOW,
  RED,
};

const char* lightPhaseName(LightPhase p);

struct PhaseState {
  uint8_t num_lanes = 0;

  LightPhase lane_phase[MAX_LANES] = {};
  uint32_t phase_since_ms[MAX_LANES] = {};

  // Lane that last received GREEN (the one to clear before advancing)
  bool has_last_green = false;
  uint8_t last_green_lane = 0;

  // Granted duration and start time of that green
  uint16_t green_duration_s = 0;
  uint32_t green_since_ms = 0;

  void reset(uint8_t lanes);

  void setPhase(uint8_t lane, LightPhase p, uint32_t now_ms);

  // Lane currently GREEN or YELLOW, if any
  bool activeLane(uint8_t& lane) const;

  // Number of lanes showing GREEN or YELLOW; 0 or 1 when the invariant holds
  uint8_t nonRedCount() const;
};
