/**
 * @file NVSStorage.cpp
 * @brief ESP32 NVS (Non-Volatile Storage) implementation
 */

#include "NVSStorage.h"
#include <esp_log.h>

static const char *TAG = "NVSStorage";

namespace PetLink {

NVSStorage::NVSStorage(const char *ns) : namespace_(ns) {}

NVSStorage::~NVSStorage() {
  if (opened_) {
    nvs_close(handle_);
    opened_ = false;
  }
}

bool NVSStorage::begin() {
  if (opened_)
    return true;

  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES ||
      err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_LOGW(TAG, "NVS partition truncated, erasing");
    err = nvs_flash_erase();
    if (err == ESP_OK)
      err = nvs_flash_init();
  }

  if (err != ESP_OK) {
    ESP_LOGE(TAG, "NVS flash init failed: %s", esp_err_to_name(err));
    return false;
  }

  err = nvs_open(namespace_, NVS_READWRITE, &handle_);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to open NVS namespace '%s': %s", namespace_,
             esp_err_to_name(err));
    return false;
  }

  opened_ = true;
  ESP_LOGI(TAG, "NVS opened namespace '%s'", namespace_);
  return true;
}

bool NVSStorage::writeU32(const char *key, uint32_t value) {
  if (!opened_)
    return false;

  esp_err_t err = nvs_set_u32(handle_, key, value);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to write '%s': %s", key, esp_err_to_name(err));
    return false;
  }
  return true;
}

bool NVSStorage::readU32(const char *key, uint32_t &out) {
  if (!opened_)
    return false;

  uint32_t value = 0;
  esp_err_t err = nvs_get_u32(handle_, key, &value);
  if (err == ESP_ERR_NVS_NOT_FOUND)
    return false;

  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to read '%s': %s", key, esp_err_to_name(err));
    return false;
  }

  out = value;
  return true;
}

bool NVSStorage::erase(const char *key) {
  if (!opened_)
    return false;

  esp_err_t err = nvs_erase_key(handle_, key);
  if (err != ESP_OK && err != ESP_ERR_NVS_NOT_FOUND) {
    ESP_LOGE(TAG, "Failed to erase '%s': %s", key, esp_err_to_name(err));
    return false;
  }

  return commit();
}

bool NVSStorage::commit() {
  if (!opened_)
    return false;

  esp_err_t err = nvs_commit(handle_);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Failed to commit: %s", esp_err_to_name(err));
    return false;
  }

  return true;
}

} // namespace PetLink
