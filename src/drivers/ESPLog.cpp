/**
 * @file ESPLog.cpp
 * @brief esp_log sink implementation
 */

#include "ESPLog.h"
#include <esp_log.h>

namespace PetLink {

void ESPLog::write(LogLevel level, const char *tag, const char *message) {
  switch (level) {
  case LogLevel::DEBUG:
    ESP_LOGD(tag, "%s", message);
    break;
  case LogLevel::INFO:
    ESP_LOGI(tag, "%s", message);
    break;
  case LogLevel::WARN:
    ESP_LOGW(tag, "%s", message);
    break;
  case LogLevel::ERROR:
    ESP_LOGE(tag, "%s", message);
    break;
  }
}

} // namespace PetLink
