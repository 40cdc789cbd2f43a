#pragma once
#include <stdint.h>

#include "Params.h"
#include "comms/Messages.h"
#include "control/LaneScheduler.h"
#include "control/PhaseState.h"

class SerialLink;

/*
===============================================================================
  TransitionController.h
===============================================================================

  PURPOSE
  -------
  Decides which lane gets the next green and drives the signal there:

    YELLOW(last) -> [clearance hold] -> RED(last) -> GREEN(next, d)

  Selection is round robin through the current cycle: the lane after the
  last green one, or the head of the cycle when the last green lane is
  unknown or no longer in it.

  USAGE
  -----
  - advance(schedule, now_ms) once per control tick
  - tick(now_ms) every loop pass; it finishes a transition once the
    clearance hold has elapsed
  - cancel() on shutdown abandons a pending RED/GREEN

  IMPORTANT
  ---------
  Open loop: if the link is down the commands are dropped (and logged as
  "would send ...") but the bookkeeping still advances. The board catches
  up with the next transition after the link returns.
===============================================================================
*/

enum class AdvanceResult : uint8_t {
  EMPTY_CYCLE = 0,      // nothing to schedule; state untouched
  CLEARANCE_PENDING,    // a yellow hold is running; state untouched
  GREEN_ISSUED,         // no lane to clear; next lane is green now
  CLEARANCE_STARTED,    // YELLOW sent; RED + GREEN follow after the hold
};

const char* advanceResultName(AdvanceResult r);

class TransitionController {
public:
  struct Params {
    uint8_t num_lanes = DEFAULT_NUM_LANES;
    uint32_t clearance_ms = YELLOW_CLEARANCE_MS;
    uint16_t min_green_s = GREEN_MIN_S;
    uint16_t max_green_s = GREEN_MAX_S;
  };

  TransitionController(SerialLink& link, const Params& params);

  AdvanceResult advance(const Schedule& schedule, uint32_t now_ms);

  // Completes a pending transition once the clearance deadline is reached.
  // Returns true if it emitted RED + GREEN on this call.
  bool tick(uint32_t now_ms);

  // Drops a pending RED/GREEN without sending anything.
  void cancel();

  bool clearancePending() const { return _pending.armed; }

  // Index in the schedule the next green would go to (schedule non-empty)
  uint8_t nextIndex(const Schedule& schedule) const;

  // True if nothing is green, or the current green has run its duration
  bool dwellElapsed(uint32_t now_ms) const;

  const PhaseState& phase() const { return _phase; }

  uint32_t commandsDropped() const { return _dropped; }
  uint32_t transitions() const { return _transitions; }

private:
  struct Pending {
    bool armed = false;
    uint8_t clear_lane = 0;
    uint8_t next_lane = 0;
    uint16_t next_duration_s = 0;
    uint32_t fire_at_ms = 0;
  };

  uint16_t grantedDuration_(const Schedule& schedule, uint8_t lane) const;
  void finish_(uint32_t now_ms);
  void emit_(const LightCommand& cmd);

  SerialLink& _link;
  Params _params;

  PhaseState _phase;
  Pending _pending;

  uint32_t _dropped = 0;
  uint32_t _transitions = 0;
};
