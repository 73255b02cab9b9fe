#ifndef LOG_H
#define LOG_H

#include <stdint.h>

enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

// Receives one formatted line ("[TAG] message") without trailing newline.
typedef void (*LogSink)(LogLevel level, const char *line);

void logSetSink(LogSink sink);
void logSetLevel(LogLevel minLevel);
LogLevel logGetLevel();

void logPrintf(LogLevel level, const char *tag, const char *fmt, ...)
    __attribute__((format(printf, 3, 4)));

void logDebug(const char *tag, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));
void logInfo(const char *tag, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));
void logWarn(const char *tag, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));
void logError(const char *tag, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

#endif
