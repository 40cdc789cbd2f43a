#pragma once

#include <stdint.h>

#include "utils/Clock.h"

/*
  Rate

  Fixed-period gate for the loop's control and status ticks. ready(now_ms)
  is true on the first call and then once per period. A late caller gets
  one tick, not a burst of missed ones.
*/

class Rate {
public:
  explicit Rate(uint16_t hz = 1) { setHz(hz); }

  // 0 Hz is treated as 1 Hz; above 1 kHz the period stays at 1 ms
  void setHz(uint16_t hz) {
    if (hz == 0) hz = 1;
    _period_ms = (uint32_t)(1000UL / hz);
    if (_period_ms == 0) _period_ms = 1;
  }

  bool ready(uint32_t now_ms) {
    if (_armed && !deadlineReached(now_ms, _due_ms)) return false;

    _armed = true;
    _due_ms = now_ms + _period_ms;
    return true;
  }

  // Next ready() fires immediately
  void reset() { _armed = false; }

  uint32_t periodMs() const { return _period_ms; }

private:
  uint32_t _period_ms = 1000;
  uint32_t _due_ms = 0;
  bool _armed = false;
};
