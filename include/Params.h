#pragma once
#include <stddef.h>
#include <stdint.h>

/*
  Params.h

  Purpose:
  Central location for controller constants and default tunables.
  Every value here can be overridden at runtime through the JSON config
  file (see src/config/Config.h) unless it is marked as a hard limit.

  Convention:
  - Durations on the wire: seconds (s)
  - Internal timing: milliseconds (ms)
  - Lane ids: 0-based internally, 1-based on the wire
*/

/* ============================================================================
   INTERSECTION
============================================================================ */

// Hard limit: storage for lane arrays is sized by this
constexpr uint8_t MAX_LANES = 8;

// Reference deployment: 4 approaches
constexpr uint8_t DEFAULT_NUM_LANES = 4;

/* ============================================================================
   GREEN DURATION TABLE
============================================================================ */

// Position in the activation cycle -> green seconds
constexpr uint16_t GREEN_FIRST_S    = 8;   // highest count lane
constexpr uint16_t GREEN_INTERIOR_S = 6;   // everything between first and last
constexpr uint16_t GREEN_LAST_S     = 4;   // lowest count lane (n >= 2)

// Hard limit: no green is ever shorter than this, whatever the config says
constexpr uint16_t GREEN_FLOOR_S = 4;

constexpr uint16_t GREEN_MIN_S = GREEN_FLOOR_S;
constexpr uint16_t GREEN_MAX_S = 60;

/* ============================================================================
   PHASE TIMING
============================================================================ */

// Yellow hold between leaving green and entering red
constexpr uint32_t YELLOW_CLEARANCE_MS = 2000;

/* ============================================================================
   SERIAL LINK
============================================================================ */

constexpr const char* SERIAL_DEVICE = "/dev/ttyUSB0";
constexpr uint32_t SERIAL_BAUD = 9600;

// Write / open timeout handed to the transport
constexpr uint32_t SERIAL_OPEN_TIMEOUT_MS = 1000;

// Microcontrollers reset when the port opens; give the sketch time to boot
constexpr uint32_t RECONNECT_SETTLE_MS = 2000;

// At most one "reconnect failed" warning per window
constexpr uint32_t RECONNECT_WARN_INTERVAL_MS = 5000;

// Longest encoded command is "P255T65535\n" -> 11 bytes; leave headroom
constexpr size_t COMMAND_LINE_MAX_BYTES = 32;

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint16_t CONTROL_UPDATE_HZ = 20;   // at most one count frame per tick
constexpr uint16_t STATUS_UPDATE_HZ  = 2;

// Sleep between loop passes so the timer checks do not spin a core
constexpr uint32_t LOOP_IDLE_MS = 5;

/* ============================================================================
   DEBUG / BEHAVIOR FLAGS
============================================================================ */

constexpr bool ENABLE_STATUS_LINES = true;

// false = advance on every tick (observed behavior of the deployed system)
// true  = only advance once the current green has been held for its duration
constexpr bool HONOR_GREEN_DURATION = false;

constexpr size_t LOG_LINE_MAX_BYTES = 256;

// Count frames on stdin: longer lines are dropped up to the next '\n'
constexpr size_t COUNT_LINE_MAX_BYTES = 128;
constexpr size_t COUNT_READ_CHUNK_BYTES = 256;

constexpr size_t STATUS_JSON_DOC_BYTES = 768;
constexpr size_t CONFIG_JSON_DOC_BYTES = 1024;
