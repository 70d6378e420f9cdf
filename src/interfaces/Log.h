/**
 * @file Log.h
 * @brief PetLink::Log - Log sink
 * @version 1.0.0
 *
 * Core code logs through this sink. On ESP32 it is backed by esp_log.
 */
#pragma once
#include <cstdarg>
#include <cstdint>
#include <cstdio>

namespace PetLink {

enum class LogLevel : uint8_t { DEBUG, INFO, WARN, ERROR };

/**
 * @interface Log
 * @brief Receives formatted log lines
 */
class Log {
public:
  virtual ~Log() = default;

  /**
   * @brief Emit one line
   * @param level Severity
   * @param tag Component tag
   * @param message Formatted text, no trailing newline
   */
  virtual void write(LogLevel level, const char *tag, const char *message) = 0;
};

/**
 * @brief printf-style helper, no-op when sink is null
 */
inline void logPrintf(Log *sink, LogLevel level, const char *tag,
                      const char *fmt, ...) {
  if (sink == nullptr)
    return;

  char buffer[192];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);
  sink->write(level, tag, buffer);
}

} // namespace PetLink
