/**
 * @file NVSStorage.h
 * @brief DRIVERS:NVSStorage - ESP32 NVS storage
 * @version 1.0.0
 *
 * Implements Storage interface for relay configuration.
 * Keys used: max_attempts, retry_ms, settle_ms, cooldown_ms, pause_ms,
 * relay_tc (u32)
 */
#pragma once
#include "../interfaces/Storage.h"
#include <nvs.h>
#include <nvs_flash.h>

namespace PetLink {

/**
 * @class NVSStorage
 * @brief ESP32 NVS storage driver
 */
class NVSStorage : public Storage {
public:
  /**
   * @brief Construct with namespace
   * @param ns NVS namespace (default: "petlink")
   */
  explicit NVSStorage(const char *ns = "petlink");
  ~NVSStorage();

  /**
   * @brief Initialize NVS, open namespace
   * @return true on success
   */
  bool begin() override;

  /**
   * @brief Write u32 (commit is left to commit())
   * @param key Storage key
   * @param value Value
   * @return true on success
   */
  bool writeU32(const char *key, uint32_t value) override;

  /**
   * @brief Read u32
   * @param key Storage key
   * @param out Value
   * @return true if key exists
   */
  bool readU32(const char *key, uint32_t &out) override;

  /**
   * @brief Delete key + commit
   * @param key Storage key
   * @return true if deleted
   */
  bool erase(const char *key) override;

  /**
   * @brief Flush to flash
   * @return true on success
   */
  bool commit() override;

private:
  const char *namespace_;
  nvs_handle_t handle_ = 0;
  bool opened_ = false;
};

} // namespace PetLink
