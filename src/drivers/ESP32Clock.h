/**
 * @file ESP32Clock.h
 * @brief DRIVERS:ESP32Clock - esp_timer time source
 * @version 1.0.0
 *
 * Implements Clock interface. Waits yield to FreeRTOS so other tasks
 * (WiFi, HTTP) keep running during relay settle and retry delays.
 */
#pragma once
#include "../interfaces/Clock.h"

namespace PetLink {

/**
 * @class ESP32Clock
 * @brief Microsecond esp_timer scaled to ms + vTaskDelay
 */
class ESP32Clock : public Clock {
public:
  ESP32Clock() = default;

  /**
   * @brief Time since boot
   * @return Milliseconds, does not wrap
   */
  uint64_t nowMs() const override;

  /**
   * @brief Block calling task
   * @param ms Duration, rounded up to one tick
   */
  void delayMs(uint32_t ms) override;
};

} // namespace PetLink
