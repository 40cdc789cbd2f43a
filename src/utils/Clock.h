#pragma once

#include <stdint.h>

#include <chrono>
#include <thread>

/*
  Host replacements for the Arduino millis() / delay() pair.

  millis() counts from the first call and wraps like the Arduino one does
  (every ~49.7 days). All timing code compares with signed subtraction,
  so the wrap is harmless.
*/

inline uint32_t millis() {
  static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  const std::chrono::steady_clock::duration dt = std::chrono::steady_clock::now() - start;
  return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(dt).count();
}

inline void delay(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// True once now_ms has reached deadline_ms (rollover safe)
inline bool deadlineReached(uint32_t now_ms, uint32_t deadline_ms) {
  return (int32_t)(now_ms - deadline_ms) >= 0;
}
