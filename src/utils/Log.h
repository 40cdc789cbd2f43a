#pragma once

#include <stdint.h>

/*
===============================================================================
  Log.h
===============================================================================

  PURPOSE
  -------
  Small printf-style logger shared by every module.

  USAGE
  -----
  Each .cpp defines its tag before using the macros:

      #define LOG_TAG "serial_link"
      ...
      LOG_WARN("reconnect failed (%s)", device);

  Lines below the current level are dropped before formatting. The default
  sink prints "[<ms>] [W] tag: message" to stderr. Tests swap the sink to
  capture output.
===============================================================================
*/

namespace logging {

enum class Level : uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
  OFF,
};

typedef void (*Sink)(Level level, const char* tag, const char* message);

void setLevel(Level level);
Level level();

// nullptr restores the default stderr sink
void setSink(Sink sink);

// "debug" | "info" | "warn" | "error" | "off"
bool parseLevel(const char* name, Level& out);

char levelChar(Level level);

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
void write(Level level, const char* tag, const char* fmt, ...);

}  // namespace logging

#define LOG_DEBUG(...) ::logging::write(::logging::Level::DEBUG, LOG_TAG, __VA_ARGS__)
#define LOG_INFO(...)  ::logging::write(::logging::Level::INFO,  LOG_TAG, __VA_ARGS__)
#define LOG_WARN(...)  ::logging::write(::logging::Level::WARN,  LOG_TAG, __VA_ARGS__)
#define LOG_ERROR(...) ::logging::write(::logging::Level::ERROR, LOG_TAG, __VA_ARGS__)
