/**
 * @file Types.h
 * @brief CORE:Types - Appliance snapshots, commands and status codes
 * @version 1.0.0
 *
 * Plain structures shared by the codec, the relay session and the
 * controller. Filled in by a CloudApi driver, consumed by core.
 */
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace PetLink {

using DeviceId = uint64_t;

#define PETLINK_BLE_HEADER_0 -6
#define PETLINK_BLE_HEADER_1 -4
#define PETLINK_BLE_HEADER_2 -3
#define PETLINK_BLE_MARKER 1
#define PETLINK_BLE_TERMINATOR -5

#define PETLINK_OP_HANDSHAKE_FIRST -41
#define PETLINK_OP_HANDSHAKE_SECOND -40
#define PETLINK_OP_MODE -36
#define PETLINK_OP_SETTINGS -35
#define PETLINK_OP_RESET_FILTER -34

#define PETLINK_PIM_ONLINE 1
#define PETLINK_PIM_ON_BATTERY 2

/**
 * @enum FountainCommand
 * @brief Every command the W5 fountain accepts over the relay
 */
enum class FountainCommand : uint8_t {
  PAUSE,
  NORMAL,
  SMART,
  NORMAL_TO_PAUSE,
  SMART_TO_PAUSE,
  RESET_FILTER,
  LIGHT_ON,
  LIGHT_OFF,
  LIGHT_LOW,
  LIGHT_MEDIUM,
  LIGHT_HIGH,
  DND_ON,
  DND_OFF,
  HANDSHAKE_FIRST,
  HANDSHAKE_SECOND
};

/**
 * @enum LitterBoxCommand
 * @brief Litter box actions sent through the plain control endpoint
 */
enum class LitterBoxCommand : uint8_t {
  POWER_ON,
  POWER_OFF,
  START_CLEAN,
  PAUSE_CLEAN,
  RESUME_CLEAN,
  ODOR_REMOVAL,
  RESET_DEODOR
};

enum class LitterBoxModel : uint8_t { T3 = 0, T4 = 1 };

/**
 * @enum ApiStatus
 * @brief Outcome of a single cloud call
 */
enum class ApiStatus : uint8_t {
  OK = 0,
  AUTH_ERROR,
  SERVER_ERROR,
  BLUETOOTH_ERROR,
  TIMEOUT,
  TRANSPORT_ERROR
};

/**
 * @enum ControlError
 * @brief Result of a controller operation
 */
enum class ControlError : uint8_t {
  NONE = 0,
  NO_RELAY_AVAILABLE,
  BLUETOOTH_LINK_FAILED,
  INVALID_COMMAND_FOR_STATE,
  MISSING_DEVICE_STATE,
  UPSTREAM_AUTH,
  UPSTREAM_SERVER,
  UPSTREAM_TRANSPORT,
  CANCELLED
};

/**
 * @enum RelayDecision
 * @brief Whether a relay can bridge BLE traffic right now
 */
enum class RelayDecision : uint8_t {
  NO_RELAY_REPORTED,
  MAIN_OFFLINE,
  MAIN_ON_BATTERY,
  AVAILABLE
};

/**
 * @struct FountainSettings
 * @brief Settings block echoed back on every settings write
 */
struct FountainSettings {
  uint8_t smartWorkingTime = 0;
  uint8_t smartSleepTime = 0;
  uint8_t lampSwitch = 0;
  uint8_t brightness = 0;
  uint16_t lightUpTime = 0;
  uint16_t lightOutTime = 0;
  uint8_t dndSwitch = 0;
  uint16_t dndStart = 0;
  uint16_t dndEnd = 0;
};

/**
 * @struct FountainState
 * @brief Latest cloud snapshot of a W5 fountain
 */
struct FountainState {
  DeviceId id = 0;
  std::string name;
  std::string mac;
  uint8_t powerStatus = 0; // 0 = paused
  uint8_t mode = 0;        // 1 = normal, 2 = smart
  bool hasSettings = false;
  FountainSettings settings;
};

struct FountainPublicState {
  FountainState device;
  uint16_t relayTypeCode = 0; // 0 = no usable relay
  RelayDecision relayDecision = RelayDecision::NO_RELAY_REPORTED;
  bool linkRefreshed = false;
};

struct LitterBoxState {
  DeviceId id = 0;
  std::string name;
  LitterBoxModel model = LitterBoxModel::T3;
  bool powerOn = false;
  bool working = false;
};

struct LitterBoxPublicState {
  LitterBoxState device;
  bool manuallyPaused = false;
  uint64_t pauseEndsAtMs = 0;
};

/**
 * @struct LitterEvent
 * @brief Most recent entry of the litter box event record
 */
struct LitterEvent {
  enum Type : uint8_t { OTHER = 0, CLEAN_OVER = 5 };
  enum Result : uint8_t { COMPLETED = 0, PAUSED = 2 };

  Type type = OTHER;
  uint8_t result = COMPLETED;
};

/**
 * @struct LitterBoxAction
 * @brief Key/type/value triple the control endpoint expects
 */
struct LitterBoxAction {
  const char *key;
  const char *type;
  int value;
};

struct RosterDevice {
  DeviceId id = 0;
  std::string type;
  uint16_t typeCode = 0;
  int pim = 0;
};

struct DeviceRoster {
  bool hasRelay = false;
  std::vector<RosterDevice> devices;
};

/**
 * @struct RelayCandidate
 * @brief Entry of the relay listing, pim filled from the roster
 */
struct RelayCandidate {
  DeviceId id = 0;
  uint16_t typeCode = 0;
  int pim = 0;
};

/**
 * @struct RelayLink
 * @brief Identifiers every relay call carries
 */
struct RelayLink {
  DeviceId bleId = 0;
  std::string mac;
  uint16_t typeCode = 0;
};

/**
 * @struct RelayConfig
 * @brief Timing and retry knobs, loadable from Storage
 */
struct RelayConfig {
  uint8_t maxAttempts = 4;
  uint32_t retryDelayMs = 3000;
  uint32_t settleDelayMs = 2000;
  uint32_t pollCooldownMs = 7 * 60 * 1000;
  uint32_t pauseWindowMs = 660 * 1000;
  uint16_t relayTypeCode = 0; // 0 = use the cloud value
};

const char *controlErrorName(ControlError err);
const char *apiStatusName(ApiStatus status);
const char *relayDecisionName(RelayDecision decision);
const char *fountainCommandName(FountainCommand cmd);

} // namespace PetLink
