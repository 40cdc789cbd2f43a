#include "control/TransitionController.h"

#include <algorithm>

#include "comms/Protocol.h"
#include "comms/SerialLink.h"
#include "utils/Log.h"

#define LOG_TAG "transition"

const char* advanceResultName(AdvanceResult r) {
  switch (r) {
    case AdvanceResult::EMPTY_CYCLE:       return "EMPTY_CYCLE";
    case AdvanceResult::CLEARANCE_PENDING: return "CLEARANCE_PENDING";
    case AdvanceResult::GREEN_ISSUED:      return "GREEN_ISSUED";
    case AdvanceResult::CLEARANCE_STARTED: return "CLEARANCE_STARTED";
  }
  return "?";
}

TransitionController::TransitionController(SerialLink& link, const Params& params)
: _link(link),
  _params(params)
{
  _phase.reset(_params.num_lanes);
}

uint8_t TransitionController::nextIndex(const Schedule& schedule) const {
  if (schedule.empty() || !_phase.has_last_green) return 0;

  const int idx = schedule.indexOf(_phase.last_green_lane);
  if (idx < 0) return 0;

  return (uint8_t)((idx + 1) % schedule.size);
}

uint16_t TransitionController::grantedDuration_(const Schedule& schedule, uint8_t lane) const {
  const uint16_t lo = std::max(_params.min_green_s, GREEN_FLOOR_S);
  const uint16_t hi = std::max(_params.max_green_s, lo);
  return std::min(std::max(schedule.duration_s[lane], lo), hi);
}

void TransitionController::emit_(const LightCommand& cmd) {
  const LinkResult r = _link.sendCommand(cmd);
  if (r == LinkResult::OK) return;

  _dropped++;

  char line[COMMAND_LINE_MAX_BYTES];
  const size_t len = protocol::encodeCommandLine(cmd, line, sizeof(line));
  if (len > 0) line[len - 1] = '\0';   // strip '\n' for the log
  LOG_WARN("would send %s (%s)", len > 0 ? line : "?", linkResultName(r));
}

AdvanceResult TransitionController::advance(const Schedule& schedule, uint32_t now_ms) {
  if (schedule.empty()) {
    LOG_DEBUG("empty cycle, nothing to do");
    return AdvanceResult::EMPTY_CYCLE;
  }

  if (_pending.armed) {
    return AdvanceResult::CLEARANCE_PENDING;
  }

  const uint8_t idx = nextIndex(schedule);
  const uint8_t lane = schedule.lanes[idx];
  const uint16_t duration_s = grantedDuration_(schedule, lane);

  if (!_phase.has_last_green) {
    LOG_INFO("lane %u green for %u s (first)", (unsigned)(lane + 1), (unsigned)duration_s);

    emit_(greenCommand(lane, duration_s));
    _phase.setPhase(lane, LightPhase::GREEN, now_ms);
    _phase.has_last_green = true;
    _phase.last_green_lane = lane;
    _phase.green_duration_s = duration_s;
    _phase.green_since_ms = now_ms;
    _transitions++;
    return AdvanceResult::GREEN_ISSUED;
  }

  const uint8_t last = _phase.last_green_lane;

  LOG_INFO("lane %u -> lane %u (cycle idx %u/%u, %u s)",
           (unsigned)(last + 1), (unsigned)(lane + 1),
           (unsigned)idx, (unsigned)schedule.size, (unsigned)duration_s);

  emit_(yellowCommand(last));
  _phase.setPhase(last, LightPhase::YELLOW, now_ms);

  _pending.armed = true;
  _pending.clear_lane = last;
  _pending.next_lane = lane;
  _pending.next_duration_s = duration_s;
  _pending.fire_at_ms = now_ms + _params.clearance_ms;

  // Zero hold: finish inside this call
  tick(now_ms);

  return AdvanceResult::CLEARANCE_STARTED;
}

bool TransitionController::tick(uint32_t now_ms) {
  if (!_pending.armed) return false;
  if ((int32_t)(now_ms - _pending.fire_at_ms) < 0) return false;

  finish_(now_ms);
  return true;
}

void TransitionController::finish_(uint32_t now_ms) {
  const Pending p = _pending;
  _pending = Pending();

  emit_(redCommand(p.clear_lane));
  _phase.setPhase(p.clear_lane, LightPhase::RED, now_ms);

  emit_(greenCommand(p.next_lane, p.next_duration_s));
  _phase.setPhase(p.next_lane, LightPhase::GREEN, now_ms);

  _phase.has_last_green = true;
  _phase.last_green_lane = p.next_lane;
  _phase.green_duration_s = p.next_duration_s;
  _phase.green_since_ms = now_ms;
  _transitions++;
}

void TransitionController::cancel() {
  if (!_pending.armed) return;

  LOG_INFO("abandoning RED%u / P%uT%u",
           (unsigned)(_pending.clear_lane + 1),
           (unsigned)(_pending.next_lane + 1),
           (unsigned)_pending.next_duration_s);
  _pending = Pending();
}

bool TransitionController::dwellElapsed(uint32_t now_ms) const {
  if (_pending.armed) return false;
  if (!_phase.has_last_green) return true;
  if (_phase.lane_phase[_phase.last_green_lane] != LightPhase::GREEN) return true;

  const uint32_t held_ms = now_ms - _phase.green_since_ms;
  return held_ms >= (uint32_t)_phase.green_duration_s * 1000u;
}
