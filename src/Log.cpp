#include "Log.h"

#include <stdarg.h>
#include <stdio.h>

static LogSink logSink = nullptr;
static LogLevel logMinLevel = LogLevel::Info;

void logSetSink(LogSink sink) { logSink = sink; }

void logSetLevel(LogLevel minLevel) { logMinLevel = minLevel; }

LogLevel logGetLevel() { return logMinLevel; }

static void logLine(LogLevel level, const char *tag, const char *fmt,
                    va_list args) {
  if (logSink == nullptr || level < logMinLevel) {
    return;
  }

  char buf[192];
  int used = snprintf(buf, sizeof(buf), "[%s] ", tag);
  if (used < 0 || static_cast<size_t>(used) >= sizeof(buf)) {
    used = 0;
  }
  vsnprintf(buf + used, sizeof(buf) - used, fmt, args);

  logSink(level, buf);
}

void logPrintf(LogLevel level, const char *tag, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logLine(level, tag, fmt, args);
  va_end(args);
}

void logDebug(const char *tag, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logLine(LogLevel::Debug, tag, fmt, args);
  va_end(args);
}

void logInfo(const char *tag, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logLine(LogLevel::Info, tag, fmt, args);
  va_end(args);
}

void logWarn(const char *tag, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logLine(LogLevel::Warn, tag, fmt, args);
  va_end(args);
}

void logError(const char *tag, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  logLine(LogLevel::Error, tag, fmt, args);
  va_end(args);
}
