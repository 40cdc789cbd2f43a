#include "comms/Protocol.h"

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements the line protocol helpers.

  Wire format:
    - Host -> board: YELLOW<n>, RED<n>, P<n>T<d>, each '\n' terminated
    - Host -> monitoring: one JSON object per line, type="status"

  Notes:
  - Command encoding uses snprintf into a caller buffer (no allocation).
  - Status encoding uses ArduinoJson, same as the board-side telemetry.
===============================================================================
*/

#include <ArduinoJson.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Parses an unsigned decimal run at *p, advancing p. Rejects empty runs and
// values above max_value.
static bool parseUnsigned(const char*& p, uint32_t max_value, uint32_t& out) {
  if (*p < '0' || *p > '9') return false;

  uint32_t v = 0;
  while (*p >= '0' && *p <= '9') {
    v = v * 10u + (uint32_t)(*p - '0');
    if (v > max_value) return false;
    ++p;
  }
  out = v;
  return true;
}

// Only an optional "\r\n" / "\n" may follow the last field
static bool atLineEnd(const char* p) {
  if (*p == '\r') ++p;
  if (*p == '\n') ++p;
  return *p == '\0';
}

static bool parseWireLane(const char*& p, uint8_t& lane) {
  uint32_t n = 0;
  if (!parseUnsigned(p, MAX_LANES, n)) return false;
  if (n == 0) return false;   // wire lanes start at 1
  lane = (uint8_t)(n - 1);
  return true;
}


namespace protocol {

/*=============================================================================
  ENCODE (Host -> Signal board)
=============================================================================*/

size_t encodeCommandLine(const LightCommand& cmd, char* out, size_t cap) {
  if (!out || cap == 0) return 0;

  const unsigned wire_lane = (unsigned)cmd.lane + 1u;
  int n = -1;

  switch (cmd.kind) {
    case CommandKind::YELLOW:
      n = snprintf(out, cap, "YELLOW%u\n", wire_lane);
      break;
    case CommandKind::RED:
      n = snprintf(out, cap, "RED%u\n", wire_lane);
      break;
    case CommandKind::GREEN:
      n = snprintf(out, cap, "P%uT%u\n", wire_lane, (unsigned)cmd.duration_s);
      break;
    default:
      break;
  }

  if (n <= 0 || (size_t)n >= cap) {
    out[0] = '\0';
    return 0;
  }
  return (size_t)n;
}


/*=============================================================================
  DECODE (Signal board side / diagnostics)
=============================================================================*/

bool decodeCommandLine(const char* line, LightCommand& out_cmd) {
  out_cmd = LightCommand();   // reset everything
  if (!line) return false;

  const char* p = line;
  LightCommand cmd;

  if (strncmp(p, "YELLOW", 6) == 0) {
    p += 6;
    cmd.kind = CommandKind::YELLOW;
    if (!parseWireLane(p, cmd.lane)) return false;
  } else if (strncmp(p, "RED", 3) == 0) {
    p += 3;
    cmd.kind = CommandKind::RED;
    if (!parseWireLane(p, cmd.lane)) return false;
  } else if (*p == 'P') {
    ++p;
    cmd.kind = CommandKind::GREEN;
    if (!parseWireLane(p, cmd.lane)) return false;
    if (*p != 'T') return false;
    ++p;

    uint32_t d = 0;
    if (!parseUnsigned(p, UINT16_MAX, d)) return false;
    if (d == 0) return false;
    cmd.duration_s = (uint16_t)d;
  } else {
    return false;
  }

  if (!atLineEnd(p)) return false;

  out_cmd = cmd;
  return true;
}


/*=============================================================================
  STATUS (Host -> monitoring)
=============================================================================*/

void encodeStatusLine(const StatusFrame& s, std::ostream& out) {
  StaticJsonDocument<STATUS_JSON_DOC_BYTES> doc;

  doc["type"] = "status";
  doc["host_time_ms"] = s.host_time_ms;
  doc["connected"] = s.connected;

  if (s.has_active_lane)
    doc["active_lane"] = s.active_lane + 1;
  else
    doc["active_lane"] = nullptr;

  doc["phase"] = s.phase ? s.phase : "NONE";
  doc["green_s"] = s.green_s;

  JsonArray cycle = doc.createNestedArray("cycle");
  for (uint8_t i = 0; i < s.cycle_size && i < MAX_LANES; ++i) {
    cycle.add(s.cycle[i] + 1);
  }

  JsonArray counts = doc.createNestedArray("counts");
  for (uint8_t i = 0; i < s.num_lanes && i < MAX_LANES; ++i) {
    counts.add(s.counts[i]);
  }

  doc["tx_ok"] = s.tx_ok;
  doc["tx_dropped"] = s.tx_dropped;

  if (s.note)
    doc["note"] = s.note;
  else
    doc["note"] = nullptr;

  serializeJson(doc, out);
  out << '\n';
}

}  // namespace protocol


const char* linkResultName(LinkResult r) {
  switch (r) {
    case LinkResult::OK:                    return "OK";
    case LinkResult::TRANSPORT_UNAVAILABLE: return "TRANSPORT_UNAVAILABLE";
    case LinkResult::WRITE_FAILED:          return "WRITE_FAILED";
    case LinkResult::ENCODE_FAILED:         return "ENCODE_FAILED";
    case LinkResult::RECONNECT_SETTLING:    return "RECONNECT_SETTLING";
    case LinkResult::RECONNECT_FAILED:      return "RECONNECT_FAILED";
  }
  return "?";
}
