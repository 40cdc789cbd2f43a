#include "vision/StreamCountSource.h"

#include <ctype.h>
#include <errno.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

#include "utils/Log.h"

#define LOG_TAG "count_source"

/*
===============================================================================
  StreamCountSource.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a line
  - If the line buffer would overflow, enters "dropping" mode until the
    next '\n'
  - A last line without '\n' still counts at end of stream
===============================================================================
*/

const char* frameStatusName(FrameStatus s) {
  switch (s) {
    case FrameStatus::FRAME:     return "FRAME";
    case FrameStatus::NO_FRAME:  return "NO_FRAME";
    case FrameStatus::EXHAUSTED: return "EXHAUSTED";
  }
  return "?";
}

StreamCountSource::StreamCountSource(int fd, uint8_t num_lanes)
: _fd(fd),
  _num_lanes(num_lanes > MAX_LANES ? MAX_LANES : num_lanes)
{
  memset(_chunk, 0, sizeof(_chunk));
  memset(_rx_buf, 0, sizeof(_rx_buf));
}

static bool isSeparator(char c) {
  return c == ' ' || c == '\t' || c == ',' || c == '\r';
}

bool StreamCountSource::parseLine(const char* line, uint8_t num_lanes, uint16_t* counts) {
  if (!line || !counts) return false;
  if (num_lanes > MAX_LANES) num_lanes = MAX_LANES;

  uint16_t parsed[MAX_LANES] = {};
  uint8_t n = 0;

  const char* p = line;
  while (true) {
    while (isSeparator(*p)) ++p;
    if (*p == '\0') break;

    if (!isdigit((unsigned char)*p)) return false;   // also rejects '-'
    if (n >= num_lanes) return false;

    uint32_t v = 0;
    while (isdigit((unsigned char)*p)) {
      v = v * 10u + (uint32_t)(*p - '0');
      if (v > UINT16_MAX) return false;
      ++p;
    }
    if (*p != '\0' && !isSeparator(*p)) return false;

    parsed[n++] = (uint16_t)v;
  }

  memcpy(counts, parsed, sizeof(uint16_t) * num_lanes);
  return true;
}

bool StreamCountSource::handleLine_() {
  const char* p = _rx_buf;
  while (*p == ' ' || *p == '\t') ++p;
  if (*p == '\0' || *p == '#') return false;

  uint16_t counts[MAX_LANES] = {};
  if (!parseLine(_rx_buf, _num_lanes, counts)) {
    _rejected++;
    LOG_WARN("line %lu: bad count frame '%.40s', skipped",
             (unsigned long)_line_no, _rx_buf);
    return false;
  }

  memcpy(_counts, counts, sizeof(_counts));
  _frames++;
  return true;
}

bool StreamCountSource::feed_(char ch) {
  if (ch == '\r') return false;

  if (_dropping) {
    // Overflowed earlier; discard until newline to resync
    if (ch == '\n') {
      _line_no++;
      _dropping = false;
      _rx_len = 0;
    }
    return false;
  }

  if (ch == '\n') {
    _line_no++;
    _rx_buf[_rx_len] = '\0';
    const bool loaded = handleLine_();
    _rx_len = 0;
    return loaded;
  }

  // Leave space for '\0'
  if (_rx_len + 1 < sizeof(_rx_buf)) {
    _rx_buf[_rx_len++] = ch;
    return false;
  }

  _rejected++;
  _dropping = true;
  _rx_len = 0;
  LOG_WARN("line %lu: longer than %u bytes, skipped",
           (unsigned long)(_line_no + 1), (unsigned)(sizeof(_rx_buf) - 1));
  return false;
}

bool StreamCountSource::drain_() {
  while (_chunk_pos < _chunk_len) {
    if (feed_(_chunk[_chunk_pos++])) return true;
  }
  _chunk_pos = _chunk_len = 0;
  return false;
}

FrameStatus StreamCountSource::endOfStream_() {
  if (!_eof) {
    _eof = true;

    // Unterminated last line
    if (_rx_len > 0 && !_dropping) {
      _line_no++;
      _rx_buf[_rx_len] = '\0';
      const bool loaded = handleLine_();
      _rx_len = 0;
      if (loaded) return FrameStatus::FRAME;
    }
  }

  if (!_eof_reported) {
    _eof_reported = true;
    LOG_INFO("count source exhausted after %lu frames", (unsigned long)_frames);
  }
  return FrameStatus::EXHAUSTED;
}

FrameStatus StreamCountSource::pollFrame(uint32_t timeout_ms) {
  // Bytes from an earlier read may hold more frames
  if (drain_()) return FrameStatus::FRAME;
  if (_eof) return endOfStream_();

  struct pollfd pfd;
  pfd.fd = _fd;
  pfd.events = POLLIN;
  pfd.revents = 0;

  const int pr = poll(&pfd, 1, (int)timeout_ms);
  if (pr < 0) {
    // A signal interrupted the wait; the caller checks its exit flag
    if (errno == EINTR) return FrameStatus::NO_FRAME;
    LOG_ERROR("poll failed: %s", strerror(errno));
    return endOfStream_();
  }
  if (pr == 0) return FrameStatus::NO_FRAME;

  const ssize_t n = ::read(_fd, _chunk, sizeof(_chunk));
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) return FrameStatus::NO_FRAME;
    LOG_ERROR("read failed: %s", strerror(errno));
    return endOfStream_();
  }
  if (n == 0) return endOfStream_();

  _chunk_len = (size_t)n;
  _chunk_pos = 0;
  return drain_() ? FrameStatus::FRAME : FrameStatus::NO_FRAME;
}

uint16_t StreamCountSource::countVehicles(uint8_t lane) {
  if (lane >= _num_lanes) return 0;
  return _counts[lane];
}
