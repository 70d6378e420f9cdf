/**
 * @file Clock.h
 * @brief PetLink::Clock - Time source and blocking waits
 * @version 1.0.0
 */
#pragma once
#include <cstdint>

namespace PetLink {

/**
 * @interface Clock
 * @brief Monotonic milliseconds + sleep
 */
class Clock {
public:
  virtual ~Clock() = default;

  /**
   * @brief Milliseconds since an arbitrary fixed origin
   */
  virtual uint64_t nowMs() const = 0;

  /**
   * @brief Block the calling task
   * @param ms Wait duration
   */
  virtual void delayMs(uint32_t ms) = 0;
};

} // namespace PetLink
