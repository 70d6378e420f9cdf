/**
 * @file PauseTracker.cpp
 * @brief CORE:PauseTracker - Manual pause window per litter box
 */

#include "PauseTracker.h"

namespace PetLink {

void PauseTracker::setWindow(uint32_t windowMs) {
  std::lock_guard<std::mutex> lock(mutex_);
  windowMs_ = windowMs;
}

uint32_t PauseTracker::window() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windowMs_;
}

void PauseTracker::notePause(DeviceId id, uint64_t nowMs) {
  std::lock_guard<std::mutex> lock(mutex_);
  PauseState &st = states_[id];
  st.paused = true;
  st.hasEnd = true;
  st.pauseEndsAtMs = nowMs + windowMs_;
}

bool PauseTracker::expireLocked(PauseState &st, uint64_t nowMs) {
  if (!st.hasEnd || nowMs < st.pauseEndsAtMs)
    return false;

  st.paused = false;
  st.hasEnd = false;
  st.pauseEndsAtMs = 0;
  return true;
}

bool PauseTracker::checkExpiry(DeviceId id, uint64_t nowMs) {
  std::lock_guard<std::mutex> lock(mutex_);
  return expireLocked(states_[id], nowMs);
}

void PauseTracker::clear(DeviceId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  PauseState &st = states_[id];
  st.paused = false;
  st.hasEnd = false;
  st.pauseEndsAtMs = 0;
}

bool PauseTracker::isPaused(DeviceId id, uint64_t nowMs) {
  std::lock_guard<std::mutex> lock(mutex_);
  PauseState &st = states_[id];
  expireLocked(st, nowMs);
  return st.paused;
}

PauseState PauseTracker::state(DeviceId id, uint64_t nowMs) {
  std::lock_guard<std::mutex> lock(mutex_);
  PauseState &st = states_[id];
  expireLocked(st, nowMs);
  return st;
}

} // namespace PetLink
