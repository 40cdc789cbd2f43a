#pragma once
#include <stdint.h>

#include <string>

#include "Params.h"
#include "comms/SerialLink.h"
#include "control/ControlLoop.h"
#include "control/LaneScheduler.h"
#include "control/TransitionController.h"
#include "utils/Log.h"

/*
===============================================================================
  Config.h
===============================================================================

  PURPOSE
  -------
  Runtime configuration. Every field starts at its Params.h default and
  can be overridden by a JSON file:

    {
      "lanes": 4,
      "serial": { "port": "/dev/ttyUSB0", "baud": 9600, "open_timeout_ms": 1000,
                  "settle_ms": 2000, "warn_interval_ms": 5000 },
      "timing": { "yellow_clearance_ms": 2000 },
      "green":  { "first_s": 8, "interior_s": 6, "last_s": 4, "min_s": 4, "max_s": 60 },
      "loop":   { "control_hz": 20, "status_hz": 2, "status_enabled": true,
                  "honor_green_duration": false },
      "log_level": "info"
    }

  Absent keys keep their defaults. A present key with the wrong type is an
  error (the whole file is rejected, nothing is applied).
===============================================================================
*/

struct RuntimeConfig {
  uint8_t num_lanes = DEFAULT_NUM_LANES;

  std::string serial_port = SERIAL_DEVICE;
  uint32_t baud = SERIAL_BAUD;
  uint32_t open_timeout_ms = SERIAL_OPEN_TIMEOUT_MS;
  uint32_t settle_ms = RECONNECT_SETTLE_MS;
  uint32_t warn_interval_ms = RECONNECT_WARN_INTERVAL_MS;

  uint32_t yellow_clearance_ms = YELLOW_CLEARANCE_MS;

  uint16_t green_first_s = GREEN_FIRST_S;
  uint16_t green_interior_s = GREEN_INTERIOR_S;
  uint16_t green_last_s = GREEN_LAST_S;
  uint16_t green_min_s = GREEN_MIN_S;
  uint16_t green_max_s = GREEN_MAX_S;

  uint16_t control_hz = CONTROL_UPDATE_HZ;
  uint16_t status_hz = STATUS_UPDATE_HZ;
  bool status_enabled = ENABLE_STATUS_LINES;
  bool honor_green_duration = HONOR_GREEN_DURATION;

  logging::Level log_level = logging::Level::INFO;
};

namespace config {

// Parse + apply + validate. On failure cfg is left untouched.
bool loadJson(const char* text, RuntimeConfig& cfg);
bool loadFile(const char* path, RuntimeConfig& cfg);

// Rejects impossible settings; raises green_min_s to GREEN_FLOOR_S.
bool validate(RuntimeConfig& cfg);

SerialLink::Params linkParams(const RuntimeConfig& cfg);
LaneScheduler::DurationParams durationParams(const RuntimeConfig& cfg);
TransitionController::Params transitionParams(const RuntimeConfig& cfg);
ControlLoop::Params loopParams(const RuntimeConfig& cfg);

}  // namespace config
