#pragma once
#include <stdint.h>

#include <ostream>

#include "Params.h"
#include "control/LaneScheduler.h"
#include "utils/Rate.h"

class SerialLink;
class StreamCountSource;
class TransitionController;

/*
===============================================================================
  ControlLoop.h
===============================================================================

  PURPOSE
  -------
  One pass of the controller's main loop, kept out of main() so it can be
  driven with a fake clock:

    - Transition tick: finish a yellow clearance whose hold has elapsed
    - Control tick (control_hz): reconnect if needed, take one count frame
      if one is ready, schedule, advance
    - Status tick (status_hz): one JSON status line

  USAGE
  -----
      while (!exit_requested && loop.step(millis())) delay(LOOP_IDLE_MS);
      loop.shutdown();

  IMPORTANT
  ---------
  step() never waits for counts. A tick with no new frame skips
  scheduling, so a stalled detector leaves the last green running but
  cannot hold a clearance open.
===============================================================================
*/

class ControlLoop {
public:
  struct Params {
    uint8_t num_lanes = DEFAULT_NUM_LANES;
    uint16_t control_hz = CONTROL_UPDATE_HZ;
    uint16_t status_hz = STATUS_UPDATE_HZ;
    bool status_enabled = ENABLE_STATUS_LINES;
    bool honor_green_duration = HONOR_GREEN_DURATION;
  };

  ControlLoop(SerialLink& link,
              const LaneScheduler& scheduler,
              TransitionController& controller,
              StreamCountSource& source,
              std::ostream& status_out,
              const Params& params);

  // Returns false once the count source is exhausted.
  bool step(uint32_t now_ms);

  // Abandons a pending RED/GREEN, then closes the link.
  void shutdown();

  const LaneCounts& counts() const { return _counts; }
  const Schedule& schedule() const { return _schedule; }

  uint32_t idleTicks() const { return _idle_ticks; }

private:
  void control_(uint32_t now_ms, bool& keep_running);
  void publishStatus_(uint32_t now_ms);

  SerialLink& _link;
  const LaneScheduler& _scheduler;
  TransitionController& _controller;
  StreamCountSource& _source;
  std::ostream& _status_out;
  Params _params;

  Rate _control_rate;
  Rate _status_rate;

  // Last frame and its schedule (kept across ticks with no frame)
  LaneCounts _counts;
  Schedule _schedule;

  // Control ticks that found no new frame
  uint32_t _idle_ticks = 0;
};
