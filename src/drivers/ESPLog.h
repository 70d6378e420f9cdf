/**
 * @file ESPLog.h
 * @brief DRIVERS:ESPLog - esp_log backed log sink
 * @version 1.0.0
 *
 * Implements Log interface. Levels map 1:1 to ESP_LOG_DEBUG..ESP_LOG_ERROR,
 * so per-tag filtering via esp_log_level_set() keeps working.
 */
#pragma once
#include "../interfaces/Log.h"

namespace PetLink {

class ESPLog : public Log {
public:
  ESPLog() = default;

  /**
   * @brief Forward to ESP_LOGx under the given tag
   * @param level Severity
   * @param tag Component tag
   * @param message Formatted text
   */
  void write(LogLevel level, const char *tag, const char *message) override;
};

} // namespace PetLink
