/**
 * @file Storage.h
 * @brief PetLink::Storage
 * @version 1.0.0
 *
 * PetLink::Controller - Persist relay configuration
 * Keys: max_attempts, retry_ms, settle_ms, cooldown_ms, pause_ms, relay_tc
 */

#pragma once

#include <cstdint>

namespace PetLink {

class Storage {
public:
  virtual ~Storage() = default;

  virtual bool begin() = 0;
  virtual bool writeU32(const char *key, uint32_t value) = 0;

  /**
   * @brief Read unsigned value
   * @param key Storage key
   * @param out Value, untouched when key is missing
   * @return true if key exists
   */
  virtual bool readU32(const char *key, uint32_t &out) = 0;
  virtual bool erase(const char *key) = 0;
  virtual bool commit() { return true; }
};

} // namespace PetLink
