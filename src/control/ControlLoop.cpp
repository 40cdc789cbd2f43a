#include "control/ControlLoop.h"

#include "comms/Protocol.h"
#include "comms/SerialLink.h"
#include "control/TransitionController.h"
#include "utils/Log.h"
#include "vision/StreamCountSource.h"

#define LOG_TAG "loop"

ControlLoop::ControlLoop(SerialLink& link,
                         const LaneScheduler& scheduler,
                         TransitionController& controller,
                         StreamCountSource& source,
                         std::ostream& status_out,
                         const Params& params)
: _link(link),
  _scheduler(scheduler),
  _controller(controller),
  _source(source),
  _status_out(status_out),
  _params(params),
  _control_rate(params.control_hz),
  _status_rate(params.status_enabled ? params.status_hz : 1)
{
  _counts.num_lanes = (_params.num_lanes > MAX_LANES) ? MAX_LANES : _params.num_lanes;
}

bool ControlLoop::step(uint32_t now_ms) {
  // Finish a running yellow clearance first so RED/GREEN go out on time
  _controller.tick(now_ms);

  bool keep_running = true;
  if (_control_rate.ready(now_ms)) {
    control_(now_ms, keep_running);
  }

  if (_params.status_enabled && _status_rate.ready(now_ms)) {
    publishStatus_(now_ms);
  }

  return keep_running;
}

void ControlLoop::control_(uint32_t now_ms, bool& keep_running) {
  if (_link.tryReconnect(now_ms) == LinkResult::RECONNECT_SETTLING) {
    LOG_DEBUG("waiting for the board to settle");
  }

  const FrameStatus fs = _source.pollFrame(0);
  if (fs == FrameStatus::EXHAUSTED) {
    keep_running = false;
    return;
  }
  if (fs == FrameStatus::NO_FRAME) {
    _idle_ticks++;
    return;
  }

  _counts = collectCounts(_source, _params.num_lanes);
  _schedule = _scheduler.schedule(_counts);

  if (_schedule.empty()) {
    LOG_DEBUG("no vehicles, holding");
    return;
  }
  if (_params.honor_green_duration && !_controller.dwellElapsed(now_ms)) {
    return;
  }

  const AdvanceResult r = _controller.advance(_schedule, now_ms);
  LOG_DEBUG("advance: %s", advanceResultName(r));
}

void ControlLoop::publishStatus_(uint32_t now_ms) {
  StatusFrame s;
  s.host_time_ms = now_ms;
  s.connected = _link.isConnected();

  const PhaseState& ps = _controller.phase();
  uint8_t active = 0;
  if (ps.activeLane(active)) {
    s.has_active_lane = true;
    s.active_lane = active;
    s.phase = lightPhaseName(ps.lane_phase[active]);
  } else if (ps.has_last_green) {
    s.phase = lightPhaseName(ps.lane_phase[ps.last_green_lane]);
  }
  s.green_s = ps.green_duration_s;

  s.num_lanes = _counts.num_lanes;
  for (uint8_t i = 0; i < _counts.num_lanes; ++i) s.counts[i] = _counts.count[i];

  s.cycle_size = _schedule.size;
  for (uint8_t i = 0; i < _schedule.size; ++i) s.cycle[i] = _schedule.lanes[i];

  s.tx_ok = _link.txOk();
  s.tx_dropped = _link.txDropped() + _link.txFail();
  s.note = _link.debugNote(now_ms);

  protocol::encodeStatusLine(s, _status_out);
  _status_out.flush();
}

void ControlLoop::shutdown() {
  // Nothing more goes to a closing port
  _controller.cancel();
  _link.end();

  LOG_INFO("stopped after %lu transitions (%lu commands dropped, %lu idle ticks)",
           (unsigned long)_controller.transitions(),
           (unsigned long)_controller.commandsDropped(),
           (unsigned long)_idle_ticks);
}
