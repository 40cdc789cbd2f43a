#pragma once
#include <stdint.h>

#include "Params.h"

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines the command and status structures exchanged between the host
  controller and the signal microcontroller, plus the typed results the
  link reports back to its callers.

  Must mirror the sketch on the signal board:
    YELLOW<n>\n     lane n (1-based) -> yellow
    RED<n>\n        lane n (1-based) -> red
    P<n>T<d>\n      lane n (1-based) -> green for d seconds

  Notes:
  - Lane ids in these structs are 0-based. Protocol.cpp converts.
  - The board never answers; there is no ACK frame.
===============================================================================
*/


/*=============================================================================
  COMMAND STRUCTURES (Host -> Signal board)
=============================================================================*/

enum class CommandKind : uint8_t {
  UNKNOWN = 0,
  YELLOW,
  RED,
  GREEN,     // "P<n>T<d>"
};

struct LightCommand {
  CommandKind kind = CommandKind::UNKNOWN;
  uint8_t lane = 0;          // 0-based
  uint16_t duration_s = 0;   // GREEN only
};

inline LightCommand yellowCommand(uint8_t lane) {
  LightCommand c;
  c.kind = CommandKind::YELLOW;
  c.lane = lane;
  return c;
}

inline LightCommand redCommand(uint8_t lane) {
  LightCommand c;
  c.kind = CommandKind::RED;
  c.lane = lane;
  return c;
}

inline LightCommand greenCommand(uint8_t lane, uint16_t duration_s) {
  LightCommand c;
  c.kind = CommandKind::GREEN;
  c.lane = lane;
  c.duration_s = duration_s;
  return c;
}


/*=============================================================================
  LINK RESULTS
=============================================================================*/

enum class LinkResult : uint8_t {
  OK = 0,
  TRANSPORT_UNAVAILABLE,   // not connected; nothing written
  WRITE_FAILED,            // write error; link is now down
  ENCODE_FAILED,           // command could not be encoded
  RECONNECT_SETTLING,      // port open, waiting for the board to boot
  RECONNECT_FAILED,        // open failed; still disconnected
};

const char* linkResultName(LinkResult r);


/*=============================================================================
  STATUS STRUCTURES (Host -> stdout)
=============================================================================*/

// One status line per STATUS_UPDATE_HZ tick
struct StatusFrame {
  uint32_t host_time_ms = 0;
  bool connected = false;

  bool has_active_lane = false;
  uint8_t active_lane = 0;        // 0-based; encoded 1-based
  const char* phase = "NONE";
  uint16_t green_s = 0;

  uint8_t num_lanes = 0;
  uint16_t counts[MAX_LANES] = {};

  uint8_t cycle_size = 0;
  uint8_t cycle[MAX_LANES] = {};  // 0-based; encoded 1-based

  uint32_t tx_ok = 0;
  uint32_t tx_dropped = 0;

  const char* note = nullptr;     // optional debug string
};
