#include "control/PhaseState.h"

const char* lightPhaseName(LightPhase p) {
  switch (p) {
    case LightPhase::NONE:   return "NONE";
    case LightPhase::GREEN:  return "GREEN";
    case LightPhase::YELLOW: return "YELLOW";
    case LightPhase::RED:    return "RED";
  }
  return "?";
}

void PhaseState::reset(uint8_t lanes) {
  *this = PhaseState();
  num_lanes = (lanes > MAX_LANES) ? MAX_LANES : lanes;
}

void PhaseState::setPhase(uint8_t lane, LightPhase p, uint32_t now_ms) {
  if (lane >= num_lanes) return;
  lane_phase[lane] = p;
  phase_since_ms[lane] = now_ms;
}

bool PhaseState::activeLane(uint8_t& lane) const {
  for (uint8_t i = 0; i < num_lanes; ++i) {
    if (lane_phase[i] == LightPhase::GREEN || lane_phase[i] == LightPhase::YELLOW) {
      lane = i;
      return true;
    }
  }
  return false;
}

uint8_t PhaseState::nonRedCount() const {
  uint8_t n = 0;
  for (uint8_t i = 0; i < num_lanes; ++i) {
    if (lane_phase[i] == LightPhase::GREEN || lane_phase[i] == LightPhase::YELLOW) n++;
  }
  return n;
}
