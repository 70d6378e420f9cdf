/**
 * @file ESP32Clock.cpp
 * @brief ESP32 esp_timer / FreeRTOS clock implementation
 */

#include "ESP32Clock.h"
#include <esp_timer.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace PetLink {

uint64_t ESP32Clock::nowMs() const {
  return static_cast<uint64_t>(esp_timer_get_time()) / 1000ULL;
}

void ESP32Clock::delayMs(uint32_t ms) {
  TickType_t ticks = pdMS_TO_TICKS(ms);
  if (ticks == 0 && ms > 0)
    ticks = 1;
  vTaskDelay(ticks);
}

} // namespace PetLink
