#include "comms/SerialLink.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "comms/Protocol.h"
#include "utils/Log.h"

#define LOG_TAG "serial_link"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - connected only after open() succeeded AND the settle deadline passed
  - any short or failed write closes the transport and drops the link
  - reconnect warnings: first failure always, then at most one per window
===============================================================================
*/

SerialLink::SerialLink(Transport& transport, const Params& params)
: _transport(transport),
  _params(params)
{
  memset(_note_buf, 0, sizeof(_note_buf));
}

LinkResult SerialLink::begin(uint32_t now_ms) {
  LOG_INFO("connecting to %s @ %lu baud",
           _params.device ? _params.device : "(none)",
           (unsigned long)_params.baud);
  return tryReconnect(now_ms);
}

void SerialLink::end() {
  if (_connected || _state.settling) {
    LOG_INFO("closing %s", _params.device ? _params.device : "(none)");
  }
  _transport.close();
  _connected = false;
  _state.settling = false;
}

void SerialLink::note_(uint32_t now_ms, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_note_buf, sizeof(_note_buf), fmt, args);
  va_end(args);
  _note_until_ms = now_ms + 1500;
}

void SerialLink::markDown_(uint32_t now_ms, const char* why) {
  _transport.close();
  _connected = false;
  _state.settling = false;
  LOG_WARN("link down: %s", why);
  note_(now_ms, "LINK DOWN %s", why);
}

void SerialLink::warnReconnect_(uint32_t now_ms) {
  if (_state.warned && (now_ms - _state.last_warn_ms) < _params.warn_interval_ms) {
    return;
  }

  _state.warned = true;
  _state.last_warn_ms = now_ms;
  _warnings++;

  LOG_WARN("could not open %s (%lu failed attempts), retrying",
           _params.device ? _params.device : "(none)",
           (unsigned long)_reconnect_failures);
}

LinkResult SerialLink::tryReconnect(uint32_t now_ms) {
  _last_now_ms = now_ms;

  if (_connected) {
    if (_transport.isOpen()) return LinkResult::OK;
    markDown_(now_ms, "transport closed");
  }

  if (_state.settling) {
    if (!_transport.isOpen()) {
      markDown_(now_ms, "transport closed while settling");
    } else if ((int32_t)(now_ms - _state.settle_until_ms) >= 0) {
      _state = State();
      _connected = true;
      _reconnects++;
      LOG_INFO("connected to %s", _params.device ? _params.device : "(none)");
      note_(now_ms, "LINK UP #%lu", (unsigned long)_reconnects);
      return LinkResult::OK;
    } else {
      return LinkResult::RECONNECT_SETTLING;
    }
  }

  if (!_transport.open(_params.device, _params.baud, _params.open_timeout_ms)) {
    _reconnect_failures++;
    warnReconnect_(now_ms);
    return LinkResult::RECONNECT_FAILED;
  }

  if (_params.settle_ms == 0) {
    _state = State();
    _connected = true;
    _reconnects++;
    LOG_INFO("connected to %s", _params.device ? _params.device : "(none)");
    note_(now_ms, "LINK UP #%lu", (unsigned long)_reconnects);
    return LinkResult::OK;
  }

  _state.settling = true;
  _state.settle_until_ms = now_ms + _params.settle_ms;
  LOG_DEBUG("port open, settling for %lu ms", (unsigned long)_params.settle_ms);
  return LinkResult::RECONNECT_SETTLING;
}

LinkResult SerialLink::send(const char* line, size_t len) {
  if (!_connected) {
    _tx_dropped++;
    return LinkResult::TRANSPORT_UNAVAILABLE;
  }

  const int n = _transport.write(line, len);
  if (n < 0 || (size_t)n != len) {
    _tx_fail++;
    markDown_(_last_now_ms, "write failed");
    return LinkResult::WRITE_FAILED;
  }

  _tx_ok++;
  return LinkResult::OK;
}

LinkResult SerialLink::sendCommand(const LightCommand& cmd) {
  char line[COMMAND_LINE_MAX_BYTES];
  const size_t len = protocol::encodeCommandLine(cmd, line, sizeof(line));
  if (len == 0) {
    LOG_ERROR("cannot encode command kind=%u lane=%u",
              (unsigned)cmd.kind, (unsigned)cmd.lane);
    return LinkResult::ENCODE_FAILED;
  }
  return send(line, len);
}
