#pragma once
#include <stddef.h>
#include <stdint.h>

#include "Params.h"
#include "comms/Messages.h"
#include "comms/Transport.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Host-side link to the signal board:

    - Encode and write newline-terminated commands via Protocol
    - Track whether the board is reachable (connected flag)
    - Reopen the transport when it drops, with a settle delay so the board
      can finish its reset before the first command
    - Rate-limit the "reconnect failed" warning so a missing cable does not
      flood the log

  IMPORTANT
  ---------
  send() never blocks when the link is down. It returns
  TRANSPORT_UNAVAILABLE at once and the caller decides how to report the
  dropped command.

  The settle delay is a deadline, not a sleep: tryReconnect() returns
  RECONNECT_SETTLING until it passes. Call tryReconnect() every control
  tick.
===============================================================================
*/

class SerialLink {
public:
  struct Params {
    const char* device = SERIAL_DEVICE;
    uint32_t baud = SERIAL_BAUD;
    uint32_t open_timeout_ms = SERIAL_OPEN_TIMEOUT_MS;
    uint32_t settle_ms = RECONNECT_SETTLE_MS;
    uint32_t warn_interval_ms = RECONNECT_WARN_INTERVAL_MS;
  };

  SerialLink(Transport& transport, const Params& params);

  // First connection attempt. Same as tryReconnect(), but always logs.
  LinkResult begin(uint32_t now_ms);

  // Closes the transport. The link reports disconnected afterwards.
  void end();

  bool isConnected() const { return _connected; }

  // No-op returning OK while connected.
  LinkResult tryReconnect(uint32_t now_ms);

  // Writes one already-encoded line.
  LinkResult send(const char* line, size_t len);

  // Encodes via protocol::encodeCommandLine and writes it.
  LinkResult sendCommand(const LightCommand& cmd);

  // Optional: short debug note (valid until _note_until_ms)
  const char* debugNote(uint32_t now_ms) const {
    return (_note_buf[0] != '\0' && (int32_t)(now_ms - _note_until_ms) <= 0) ? _note_buf : nullptr;
  }

  // TX / link stats
  uint32_t txOk() const { return _tx_ok; }
  uint32_t txFail() const { return _tx_fail; }
  uint32_t txDropped() const { return _tx_dropped; }
  uint32_t reconnects() const { return _reconnects; }
  uint32_t reconnectFailures() const { return _reconnect_failures; }
  uint32_t warningsEmitted() const { return _warnings; }

  const Params& params() const { return _params; }

private:
  // Link state, rebuilt on every successful open
  struct State {
    bool settling = false;
    uint32_t settle_until_ms = 0;

    bool warned = false;
    uint32_t last_warn_ms = 0;
  };

  void markDown_(uint32_t now_ms, const char* why);
  void warnReconnect_(uint32_t now_ms);
  void note_(uint32_t now_ms, const char* fmt, ...)
#if defined(__GNUC__)
      __attribute__((format(printf, 3, 4)))
#endif
      ;

  Transport& _transport;
  Params _params;

  bool _connected = false;
  State _state;

  // Last time anything called us with a clock; send() has none
  uint32_t _last_now_ms = 0;

  uint32_t _tx_ok = 0;
  uint32_t _tx_fail = 0;
  uint32_t _tx_dropped = 0;
  uint32_t _reconnects = 0;
  uint32_t _reconnect_failures = 0;
  uint32_t _warnings = 0;

  // Debug note buffer (for status note)
  char _note_buf[96];
  uint32_t _note_until_ms = 0;
};
