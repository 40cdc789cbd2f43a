#include "comms/SerialPort.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include "utils/Log.h"

#define LOG_TAG "serial_port"

static bool toSpeed(uint32_t baud, speed_t& out) {
  switch (baud) {
    case 1200:   out = B1200;   return true;
    case 2400:   out = B2400;   return true;
    case 4800:   out = B4800;   return true;
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default:     return false;
  }
}

SerialPort::SerialPort() {}

SerialPort::~SerialPort() {
  close();
}

bool SerialPort::baudSupported(uint32_t baud) {
  speed_t s;
  return toSpeed(baud, s);
}

bool SerialPort::open(const char* device, uint32_t baud, uint32_t timeout_ms) {
  close();

  if (!device || device[0] == '\0') return false;

  // O_NONBLOCK so a missing carrier cannot hang open()
  _fd = ::open(device, O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (_fd < 0) {
    LOG_DEBUG("open(%s) failed: %s", device, strerror(errno));
    return false;
  }

  _timeout_ms = timeout_ms;

  if (!configure_(baud)) {
    close();
    return false;
  }

  LOG_DEBUG("opened %s @ %lu", device, (unsigned long)baud);
  return true;
}

bool SerialPort::configure_(uint32_t baud) {
  speed_t speed;
  if (!toSpeed(baud, speed)) {
    LOG_ERROR("unsupported baud %lu", (unsigned long)baud);
    return false;
  }

  struct termios tio;
  if (tcgetattr(_fd, &tio) != 0) {
    LOG_DEBUG("tcgetattr failed: %s", strerror(errno));
    return false;
  }

  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CSTOPB;
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  if (cfsetispeed(&tio, speed) != 0 || cfsetospeed(&tio, speed) != 0) {
    return false;
  }
  if (tcsetattr(_fd, TCSANOW, &tio) != 0) {
    LOG_DEBUG("tcsetattr failed: %s", strerror(errno));
    return false;
  }

  tcflush(_fd, TCIOFLUSH);
  return true;
}

void SerialPort::close() {
  if (_fd < 0) return;
  ::close(_fd);
  _fd = -1;
}

int SerialPort::write(const char* data, size_t len) {
  if (_fd < 0) return -1;

  size_t sent = 0;
  while (sent < len) {
    struct pollfd pfd;
    pfd.fd = _fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    const int pr = poll(&pfd, 1, (int)_timeout_ms);
    if (pr < 0) {
      if (errno == EINTR) continue;
      LOG_WARN("poll failed: %s", strerror(errno));
      return -1;
    }
    if (pr == 0) {
      LOG_WARN("write timed out after %lu ms", (unsigned long)_timeout_ms);
      return -1;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      close();
      return -1;
    }

    const ssize_t n = ::write(_fd, data + sent, len - sent);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      const int err = errno;
      LOG_WARN("write failed: %s", strerror(err));
      if (err == EIO || err == ENXIO || err == ENODEV) {
        close();
      }
      return -1;
    }
    sent += (size_t)n;
  }

  return (int)sent;
}
