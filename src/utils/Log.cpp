#include "utils/Log.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include "Params.h"
#include "utils/Clock.h"

namespace {

logging::Level g_level = logging::Level::INFO;

void stderrSink(logging::Level level, const char* tag, const char* message) {
  fprintf(stderr, "[%lu] [%c] %s: %s\n",
          (unsigned long)millis(),
          logging::levelChar(level),
          tag ? tag : "-",
          message);
  fflush(stderr);
}

logging::Sink g_sink = stderrSink;

}  // namespace

namespace logging {

void setLevel(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

void setSink(Sink sink) { g_sink = sink ? sink : stderrSink; }

bool parseLevel(const char* name, Level& out) {
  if (!name) return false;
  if (strcmp(name, "debug") == 0) { out = Level::DEBUG; return true; }
  if (strcmp(name, "info") == 0)  { out = Level::INFO;  return true; }
  if (strcmp(name, "warn") == 0)  { out = Level::WARN;  return true; }
  if (strcmp(name, "error") == 0) { out = Level::ERROR; return true; }
  if (strcmp(name, "off") == 0)   { out = Level::OFF;   return true; }
  return false;
}

char levelChar(Level lvl) {
  switch (lvl) {
    case Level::DEBUG: return 'D';
    case Level::INFO:  return 'I';
    case Level::WARN:  return 'W';
    case Level::ERROR: return 'E';
    default:           return '?';
  }
}

void write(Level lvl, const char* tag, const char* fmt, ...) {
  if (lvl == Level::OFF || (uint8_t)lvl < (uint8_t)g_level) return;

  char buf[LOG_LINE_MAX_BYTES];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  g_sink(lvl, tag, buf);
}

}  // namespace logging
