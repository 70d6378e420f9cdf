/**
 * @file Types.cpp
 * @brief CORE:Types - Printable names for status codes
 */

#include "Types.h"

namespace PetLink {

const char *controlErrorName(ControlError err) {
  switch (err) {
  case ControlError::NONE:
    return "NONE";
  case ControlError::NO_RELAY_AVAILABLE:
    return "NO_RELAY_AVAILABLE";
  case ControlError::BLUETOOTH_LINK_FAILED:
    return "BLUETOOTH_LINK_FAILED";
  case ControlError::INVALID_COMMAND_FOR_STATE:
    return "INVALID_COMMAND_FOR_STATE";
  case ControlError::MISSING_DEVICE_STATE:
    return "MISSING_DEVICE_STATE";
  case ControlError::UPSTREAM_AUTH:
    return "UPSTREAM_AUTH";
  case ControlError::UPSTREAM_SERVER:
    return "UPSTREAM_SERVER";
  case ControlError::UPSTREAM_TRANSPORT:
    return "UPSTREAM_TRANSPORT";
  case ControlError::CANCELLED:
    return "CANCELLED";
  }
  return "?";
}

const char *apiStatusName(ApiStatus status) {
  switch (status) {
  case ApiStatus::OK:
    return "OK";
  case ApiStatus::AUTH_ERROR:
    return "AUTH_ERROR";
  case ApiStatus::SERVER_ERROR:
    return "SERVER_ERROR";
  case ApiStatus::BLUETOOTH_ERROR:
    return "BLUETOOTH_ERROR";
  case ApiStatus::TIMEOUT:
    return "TIMEOUT";
  case ApiStatus::TRANSPORT_ERROR:
    return "TRANSPORT_ERROR";
  }
  return "?";
}

const char *relayDecisionName(RelayDecision decision) {
  switch (decision) {
  case RelayDecision::NO_RELAY_REPORTED:
    return "NO_RELAY_REPORTED";
  case RelayDecision::MAIN_OFFLINE:
    return "MAIN_OFFLINE";
  case RelayDecision::MAIN_ON_BATTERY:
    return "MAIN_ON_BATTERY";
  case RelayDecision::AVAILABLE:
    return "AVAILABLE";
  }
  return "?";
}

const char *fountainCommandName(FountainCommand cmd) {
  switch (cmd) {
  case FountainCommand::PAUSE:
    return "Pause";
  case FountainCommand::NORMAL:
    return "Normal";
  case FountainCommand::SMART:
    return "Smart";
  case FountainCommand::NORMAL_TO_PAUSE:
    return "Normal To Pause";
  case FountainCommand::SMART_TO_PAUSE:
    return "Smart To Pause";
  case FountainCommand::RESET_FILTER:
    return "Reset Filter";
  case FountainCommand::LIGHT_ON:
    return "Light On";
  case FountainCommand::LIGHT_OFF:
    return "Light Off";
  case FountainCommand::LIGHT_LOW:
    return "Light Low";
  case FountainCommand::LIGHT_MEDIUM:
    return "Light Medium";
  case FountainCommand::LIGHT_HIGH:
    return "Light High";
  case FountainCommand::DND_ON:
    return "Do Not Disturb";
  case FountainCommand::DND_OFF:
    return "Do Not Disturb Off";
  case FountainCommand::HANDSHAKE_FIRST:
    return "First BLE Command";
  case FountainCommand::HANDSHAKE_SECOND:
    return "Second BLE Command";
  }
  return "?";
}

} // namespace PetLink
