#pragma once
#include <stddef.h>

#include <ostream>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the host <-> signal board wire protocol, and
  the JSON status line the controller publishes for monitoring.

  Wire format:
    - ASCII, one command per line, '\n' terminated
    - lane numbers are 1-based on the wire
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Host -> Signal board)
=============================================================================*/

/*
  Writes one command line (including trailing '\n') into out.

  Returns:
    - number of bytes written (excluding the terminating '\0')
    - 0 if the command is UNKNOWN or does not fit in cap
*/
size_t encodeCommandLine(const LightCommand& cmd, char* out, size_t cap);


/*=============================================================================
  DECODE (Signal board side / diagnostics)
=============================================================================*/

/*
  Parses one command line. A trailing "\n" or "\r\n" is accepted.

  Returns false for anything outside the grammar: unknown prefix, lane 0,
  missing digits, trailing bytes, or values that overflow.
*/
bool decodeCommandLine(const char* line, LightCommand& out_cmd);


/*=============================================================================
  STATUS (Host -> monitoring)
=============================================================================*/

// Writes one status JSON line (includes trailing '\n')
void encodeStatusLine(const StatusFrame& s, std::ostream& out);

}  // namespace protocol
