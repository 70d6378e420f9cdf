/**
 * @file PauseTracker.h
 * @brief CORE:PauseTracker - Manual pause window per litter box
 * @version 1.0.0
 *
 * A manual pause lasts the device pause window (10 min) plus a 1 min
 * cleaning margin. Expiry is checked lazily on every read.
 */
#pragma once
#include "Types.h"
#include <map>
#include <mutex>

namespace PetLink {

/**
 * @struct PauseState
 * @brief hasEnd is set iff paused came from an explicit pause
 */
struct PauseState {
  bool paused = false;
  bool hasEnd = false;
  uint64_t pauseEndsAtMs = 0;
};

class PauseTracker {
public:
  explicit PauseTracker(uint32_t windowMs = 660 * 1000) : windowMs_(windowMs) {}

  void setWindow(uint32_t windowMs);
  uint32_t window() const;

  /**
   * @brief Record a successful pause command
   * @param id Litter box id
   * @param nowMs Current time
   */
  void notePause(DeviceId id, uint64_t nowMs);

  /**
   * @brief Clear the pause if its window has passed
   * @return true if the pause ended now
   */
  bool checkExpiry(DeviceId id, uint64_t nowMs);

  /// @brief Explicit resume or start; wins over the timer
  void clear(DeviceId id);

  /// @brief checkExpiry() then report the flag
  bool isPaused(DeviceId id, uint64_t nowMs);

  /// @brief checkExpiry() then copy the full state
  PauseState state(DeviceId id, uint64_t nowMs);

private:
  bool expireLocked(PauseState &st, uint64_t nowMs);

  mutable std::mutex mutex_;
  uint32_t windowMs_;
  std::map<DeviceId, PauseState> states_;
};

} // namespace PetLink
