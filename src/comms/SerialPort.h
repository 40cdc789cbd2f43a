#pragma once

#include "comms/Transport.h"

/*
  SerialPort

  POSIX termios transport: raw 8N1, no flow control, non-blocking fd.
  write() waits up to the open timeout for the fd to become writable and
  treats EIO/ENXIO/ENODEV as "device unplugged" (closes itself).
*/

class SerialPort : public Transport {
public:
  SerialPort();
  ~SerialPort() override;

  bool open(const char* device, uint32_t baud, uint32_t timeout_ms) override;
  void close() override;
  bool isOpen() const override { return _fd >= 0; }

  int write(const char* data, size_t len) override;

  // Maps 9600 -> B9600 etc. Returns false for rates termios does not know.
  static bool baudSupported(uint32_t baud);

private:
  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  bool configure_(uint32_t baud);

  int _fd = -1;
  uint32_t _timeout_ms = 0;
};
