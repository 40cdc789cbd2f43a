#pragma once
#include <stddef.h>
#include <stdint.h>

#include "Params.h"
#include "vision/VehicleCounter.h"

/*
===============================================================================
  StreamCountSource.h
===============================================================================

  PURPOSE
  -------
  VehicleCounter fed from a file descriptor (stdin in the controller),
  one frame per line:

      5 0 3 1        -> lane 1: 5, lane 2: 0, lane 3: 3, lane 4: 1

  - blank lines and lines starting with '#' are skipped
  - missing trailing values read as 0
  - negative values, non-numeric tokens, values above 65535 or more values
    than lanes make the line invalid; it is logged and skipped
  - lines longer than COUNT_LINE_MAX_BYTES are dropped up to the next '\n'

  Lets the controller run from a replay file or from an external detector
  piping its counts in.

  IMPORTANT
  ---------
  pollFrame() never waits longer than its timeout. A detector that stalls
  must not stall the loop: the clearance hold and the exit flag are
  serviced between polls.
===============================================================================
*/

enum class FrameStatus : uint8_t {
  FRAME = 0,    // a new frame is loaded
  NO_FRAME,     // nothing complete yet; try again next tick
  EXHAUSTED,    // end of stream (or read error); no more frames
};

const char* frameStatusName(FrameStatus s);

class StreamCountSource : public VehicleCounter {
public:
  // fd is not owned; it is never closed here
  StreamCountSource(int fd, uint8_t num_lanes);

  // Waits up to timeout_ms for input, then loads at most one frame.
  FrameStatus pollFrame(uint32_t timeout_ms);

  uint16_t countVehicles(uint8_t lane) override;

  uint32_t framesRead() const { return _frames; }
  uint32_t linesRejected() const { return _rejected; }

  // Parses one line into counts. Exposed for tests.
  static bool parseLine(const char* line, uint8_t num_lanes, uint16_t* counts);

private:
  // Feeds buffered bytes through the line assembler until a frame loads
  bool drain_();
  bool feed_(char ch);
  bool handleLine_();

  FrameStatus endOfStream_();

  int _fd;
  uint8_t _num_lanes;

  uint16_t _counts[MAX_LANES] = {};

  // Bytes read from the fd, not yet fed
  char _chunk[COUNT_READ_CHUNK_BYTES];
  size_t _chunk_len = 0;
  size_t _chunk_pos = 0;

  // Line being assembled
  char _rx_buf[COUNT_LINE_MAX_BYTES];
  size_t _rx_len = 0;
  bool _dropping = false;

  bool _eof = false;
  bool _eof_reported = false;

  uint32_t _line_no = 0;
  uint32_t _frames = 0;
  uint32_t _rejected = 0;
};
