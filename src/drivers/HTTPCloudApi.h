/**
 * @file HTTPCloudApi.h
 * @brief DRIVERS:HTTPCloudApi - Vendor cloud over HTTPClient + ArduinoJson
 * @version 1.0.0
 *
 * Implements CloudApi interface. Every request is a form-encoded POST
 * carrying the session token; responses are {"result": ...} or
 * {"error": {"code", "msg"}}.
 *
 * Error codes: 1 -> SERVER_ERROR, 5/122 -> AUTH_ERROR,
 * 3003 -> BLUETOOTH_ERROR, others -> SERVER_ERROR
 */
#pragma once
#include "../interfaces/CloudApi.h"
#include "../interfaces/TokenProvider.h"
#include <Arduino.h>

#define ARDUINOJSON_USE_LONG_LONG 1
#include <ArduinoJson.h>

namespace PetLink {

#define PETLINK_REGION_US "http://api.petkt.com/latest"
#define PETLINK_REGION_CN "http://api.petkit.cn/6"
#define PETLINK_API_VERSION "8.28.0"
#define PETLINK_JSON_CAPACITY 16384

/**
 * @class HTTPCloudApi
 * @brief ESP32 HTTP driver for the vendor cloud
 */
class HTTPCloudApi : public CloudApi {
public:
  /**
   * @brief Construct with region and token source
   * @param baseUrl PETLINK_REGION_US or PETLINK_REGION_CN
   * @param tokens Session token provider (required)
   * @param timeoutMs Per-request timeout
   */
  HTTPCloudApi(const char *baseUrl, TokenProvider *tokens,
               uint32_t timeoutMs = 15000);

  ApiStatus fetchRoster(DeviceRoster &out) override;
  ApiStatus listRelayCandidates(std::vector<RelayCandidate> &out) override;
  ApiStatus fetchFountain(DeviceId id, FountainState &out) override;
  ApiStatus bleConnect(const RelayLink &link, int &state) override;
  ApiStatus blePoll(const RelayLink &link, int &result) override;
  ApiStatus bleCancel(const RelayLink &link) override;
  ApiStatus bleControl(const RelayLink &link, uint8_t commandCode,
                       const std::string &data) override;
  ApiStatus fetchLitterBox(DeviceId id, LitterBoxModel model,
                           LitterBoxState &out) override;
  ApiStatus controlLitterBox(DeviceId id, LitterBoxModel model,
                             const LitterBoxAction &action) override;
  ApiStatus fetchLatestLitterEvent(DeviceId id, LitterBoxModel model,
                                   LitterEvent &out) override;

private:
  String baseUrl_;
  TokenProvider *tokens_;
  uint32_t timeoutMs_;

  /**
   * @brief POST form body, parse JSON, map vendor errors
   * @param path Endpoint path (e.g. "/ble/poll")
   * @param form key=value&... body
   * @param doc Parsed response on OK
   */
  ApiStatus post(const String &path, const String &form,
                 DynamicJsonDocument &doc);

  /** @brief key=value pair with both sides percent-encoded */
  static void appendField(String &form, const char *key, const String &value);

  /** @brief bleId/mac/type fields shared by all relay calls */
  static String linkForm(const RelayLink &link);

  static String idString(DeviceId id);
  static const char *modelPath(LitterBoxModel model);

  /** @brief YYYYMMDD of the local date */
  static String today();

  static ApiStatus mapVendorError(int code);
};

} // namespace PetLink
