/**
 * @file HTTPCloudApi.cpp
 * @brief DRIVERS:HTTPCloudApi - Vendor cloud over HTTPClient + ArduinoJson
 */

#include "HTTPCloudApi.h"
#include "../core/Codec.h"
#include <HTTPClient.h>
#include <WiFiClient.h>
#include <esp_log.h>
#include <time.h>

static const char *TAG = "HTTPCloudApi";

namespace PetLink {

HTTPCloudApi::HTTPCloudApi(const char *baseUrl, TokenProvider *tokens,
                           uint32_t timeoutMs)
    : baseUrl_(baseUrl), tokens_(tokens), timeoutMs_(timeoutMs) {}

ApiStatus HTTPCloudApi::mapVendorError(int code) {
  switch (code) {
  case 5:
  case 122:
    return ApiStatus::AUTH_ERROR;
  case 3003:
    return ApiStatus::BLUETOOTH_ERROR;
  default:
    return ApiStatus::SERVER_ERROR;
  }
}

void HTTPCloudApi::appendField(String &form, const char *key,
                               const String &value) {
  if (form.length() > 0)
    form += '&';
  form += Codec::percentEncode(key).c_str();
  form += '=';
  form += Codec::percentEncode(value.c_str()).c_str();
}

String HTTPCloudApi::idString(DeviceId id) {
  char buf[24];
  snprintf(buf, sizeof(buf), "%llu", static_cast<unsigned long long>(id));
  return String(buf);
}

String HTTPCloudApi::linkForm(const RelayLink &link) {
  String form;
  appendField(form, "bleId", idString(link.bleId));
  appendField(form, "mac", String(link.mac.c_str()));
  appendField(form, "type", String(link.typeCode));
  return form;
}

const char *HTTPCloudApi::modelPath(LitterBoxModel model) {
  switch (model) {
  case LitterBoxModel::T3:
    return "/t3";
  case LitterBoxModel::T4:
    return "/t4";
  }
  return "/t3";
}

String HTTPCloudApi::today() {
  time_t now = time(nullptr);
  struct tm local;
  localtime_r(&now, &local);
  char buf[9];
  strftime(buf, sizeof(buf), "%Y%m%d", &local);
  return String(buf);
}

ApiStatus HTTPCloudApi::post(const String &path, const String &form,
                             DynamicJsonDocument &doc) {
  std::string token;
  if (!tokens_ || !tokens_->token(token)) {
    ESP_LOGE(TAG, "No session token for %s", path.c_str());
    return ApiStatus::AUTH_ERROR;
  }

  WiFiClient client;
  HTTPClient http;
  String url = baseUrl_ + path;

  if (!http.begin(client, url)) {
    ESP_LOGE(TAG, "http.begin() failed for %s", url.c_str());
    return ApiStatus::TRANSPORT_ERROR;
  }
  http.setTimeout(timeoutMs_);

  http.addHeader("X-Session", token.c_str());
  http.addHeader("F-Session", token.c_str());
  http.addHeader("Accept", "*/*");
  http.addHeader("Accept-Language", "en-US;q=1, it-US;q=0.9");
  http.addHeader("X-Api-Version", PETLINK_API_VERSION);
  http.addHeader("Content-Type", "application/x-www-form-urlencoded");
  http.addHeader("User-Agent", "PETKIT/" PETLINK_API_VERSION
                               " (iPhone; iOS 15.1; Scale/3.00)");
  http.addHeader("X-Client", "ios(15.1;iPhone14,3)");

  int httpCode = http.POST(form);

  if (httpCode < 0) {
    ESP_LOGW(TAG, "%s: %s", path.c_str(), http.errorToString(httpCode).c_str());
    http.end();
    return (httpCode == HTTPC_ERROR_READ_TIMEOUT) ? ApiStatus::TIMEOUT
                                                  : ApiStatus::TRANSPORT_ERROR;
  }

  String body = http.getString();
  http.end();

  if (httpCode != HTTP_CODE_OK) {
    ESP_LOGW(TAG, "%s: HTTP %d", path.c_str(), httpCode);
    return ApiStatus::SERVER_ERROR;
  }

  DeserializationError err = deserializeJson(doc, body);
  if (err) {
    ESP_LOGW(TAG, "%s: JSON parse failed (%s)", path.c_str(), err.c_str());
    return ApiStatus::SERVER_ERROR;
  }

  JsonVariant error = doc["error"];
  if (!error.isNull()) {
    int code = error["code"] | 0;
    const char *msg = error["msg"] | "";
    ESP_LOGW(TAG, "%s: vendor error %d: %s", path.c_str(), code, msg);
    return mapVendorError(code);
  }

  return ApiStatus::OK;
}

ApiStatus HTTPCloudApi::fetchRoster(DeviceRoster &out) {
  String form;
  appendField(form, "day", today());

  DynamicJsonDocument doc(PETLINK_JSON_CAPACITY);
  ApiStatus status = post("/discovery/device_roster", form, doc);
  if (status != ApiStatus::OK)
    return status;

  JsonObject result = doc["result"];
  out.hasRelay = result["hasRelay"] | false;
  out.devices.clear();

  for (JsonObject item : result["devices"].as<JsonArray>()) {
    JsonObject data = item["data"];
    RosterDevice device;
    device.id = data["id"].as<unsigned long long>();
    device.type = item["type"] | "";
    device.typeCode = data["typeCode"] | 0;
    device.pim = data["status"]["pim"] | 0;
    out.devices.push_back(device);
  }

  ESP_LOGD(TAG, "Roster: %u devices, hasRelay=%d",
           static_cast<unsigned>(out.devices.size()), out.hasRelay);
  return ApiStatus::OK;
}

ApiStatus HTTPCloudApi::listRelayCandidates(std::vector<RelayCandidate> &out) {
  DynamicJsonDocument doc(PETLINK_JSON_CAPACITY);
  ApiStatus status = post("/ble/ownSupportBleDevices", String(), doc);
  if (status != ApiStatus::OK)
    return status;

  out.clear();
  for (JsonObject item : doc["result"].as<JsonArray>()) {
    RelayCandidate candidate;
    candidate.id = item["id"].as<unsigned long long>();
    candidate.typeCode = item["typeCode"] | 0;
    out.push_back(candidate);
  }
  return ApiStatus::OK;
}

ApiStatus HTTPCloudApi::fetchFountain(DeviceId id, FountainState &out) {
  String form;
  appendField(form, "id", idString(id));

  DynamicJsonDocument doc(PETLINK_JSON_CAPACITY);
  ApiStatus status = post("/w5/deviceData", form, doc);
  if (status != ApiStatus::OK)
    return status;

  JsonObject result = doc["result"];
  out = FountainState();
  out.id = result["id"].as<unsigned long long>();
  out.name = result["name"] | "";
  out.mac = result["mac"] | "";
  out.powerStatus = result["powerStatus"] | 0;
  out.mode = result["mode"] | 0;

  JsonObject settings = result["settings"];
  out.hasSettings = !settings.isNull();
  if (out.hasSettings) {
    FountainSettings &s = out.settings;
    s.smartWorkingTime = settings["smartWorkingTime"] | 0;
    s.smartSleepTime = settings["smartSleepTime"] | 0;
    s.lampSwitch = settings["lampRingSwitch"] | 0;
    s.brightness = settings["lampRingBrightness"] | 0;
    s.lightUpTime = settings["lampRingLightUpTime"] | 0;
    s.lightOutTime = settings["lampRingGoOutTime"] | 0;
    s.dndSwitch = settings["noDisturbingSwitch"] | 0;
    s.dndStart = settings["noDisturbingStartTime"] | 0;
    s.dndEnd = settings["noDisturbingEndTime"] | 0;
  }
  return ApiStatus::OK;
}

ApiStatus HTTPCloudApi::bleConnect(const RelayLink &link, int &state) {
  DynamicJsonDocument doc(1024);
  ApiStatus status = post("/ble/connect", linkForm(link), doc);
  if (status != ApiStatus::OK)
    return status;

  state = doc["result"]["state"] | -1;
  return ApiStatus::OK;
}

ApiStatus HTTPCloudApi::blePoll(const RelayLink &link, int &result) {
  DynamicJsonDocument doc(1024);
  ApiStatus status = post("/ble/poll", linkForm(link), doc);
  if (status != ApiStatus::OK)
    return status;

  result = doc["result"] | -1;
  return ApiStatus::OK;
}

ApiStatus HTTPCloudApi::bleCancel(const RelayLink &link) {
  DynamicJsonDocument doc(1024);
  return post("/ble/cancel", linkForm(link), doc);
}

ApiStatus HTTPCloudApi::bleControl(const RelayLink &link, uint8_t commandCode,
                                   const std::string &data) {
  String form;
  appendField(form, "bleId", idString(link.bleId));
  appendField(form, "cmd", String(commandCode));
  appendField(form, "data", String(data.c_str()));
  appendField(form, "mac", String(link.mac.c_str()));
  appendField(form, "type", String(link.typeCode));

  DynamicJsonDocument doc(1024);
  return post("/ble/controlDevice", form, doc);
}

ApiStatus HTTPCloudApi::fetchLitterBox(DeviceId id, LitterBoxModel model,
                                       LitterBoxState &out) {
  String form;
  appendField(form, "id", idString(id));

  DynamicJsonDocument doc(PETLINK_JSON_CAPACITY);
  ApiStatus status =
      post(String(modelPath(model)) + "/device_detail", form, doc);
  if (status != ApiStatus::OK)
    return status;

  JsonObject result = doc["result"];
  out = LitterBoxState();
  out.id = result["id"].as<unsigned long long>();
  out.name = result["name"] | "";
  out.model = model;
  out.powerOn = (result["state"]["power"] | 0) == 1;
  out.working = !result["state"]["work_state"].isNull();
  return ApiStatus::OK;
}

ApiStatus HTTPCloudApi::controlLitterBox(DeviceId id, LitterBoxModel model,
                                         const LitterBoxAction &action) {
  DynamicJsonDocument kvDoc(128);
  kvDoc[action.key] = action.value;
  String kv;
  serializeJson(kvDoc, kv);

  String form;
  appendField(form, "id", idString(id));
  appendField(form, "kv", kv);
  appendField(form, "type", action.type);

  DynamicJsonDocument doc(1024);
  ApiStatus status =
      post(String(modelPath(model)) + "/controlDevice", form, doc);
  if (status == ApiStatus::OK)
    ESP_LOGI(TAG, "%s sent to %s", kv.c_str(), idString(id).c_str());
  return status;
}

ApiStatus HTTPCloudApi::fetchLatestLitterEvent(DeviceId id,
                                               LitterBoxModel model,
                                               LitterEvent &out) {
  String form;
  appendField(form, "date", today());
  appendField(form, "deviceId", idString(id));

  DynamicJsonDocument doc(PETLINK_JSON_CAPACITY * 2);
  ApiStatus status =
      post(String(modelPath(model)) + "/getDeviceRecord", form, doc);
  if (status != ApiStatus::OK)
    return status;

  out = LitterEvent();
  JsonArray records = doc["result"].as<JsonArray>();
  if (records.isNull() || records.size() == 0)
    return ApiStatus::OK;

  // Records are ordered oldest first
  JsonObject latest = records[records.size() - 1];
  int type = latest["eventType"] | 0;
  out.type = (type == LitterEvent::CLEAN_OVER) ? LitterEvent::CLEAN_OVER
                                               : LitterEvent::OTHER;
  out.result = latest["content"]["result"] | 0;
  return ApiStatus::OK;
}

} // namespace PetLink
