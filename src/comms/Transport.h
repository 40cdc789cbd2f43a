#pragma once
#include <stddef.h>
#include <stdint.h>

/*
  Transport

  Byte sink the SerialLink writes commands into. Plays the role of the
  Arduino Stream& the board-side link wraps; SerialPort is the real one,
  tests plug in a fake.

  write() returns the number of bytes written, or -1 on error. After an
  error that means the device is gone, isOpen() must report false.
*/

class Transport {
public:
  virtual ~Transport() {}

  virtual bool open(const char* device, uint32_t baud, uint32_t timeout_ms) = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;

  virtual int write(const char* data, size_t len) = 0;
};
