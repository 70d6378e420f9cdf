/**
 * @file PetLink.cpp
 * @brief Main PetLink controller implementation
 *
 * Thin orchestrator that coordinates resolver, relay sessions, the pause
 * tracker and configuration storage.
 */

#include "PetLink.h"

static const char *TAG = "PetLink";

namespace PetLink {

// Indexed by LitterBoxCommand
static const LitterBoxAction LITTER_ACTIONS[] = {
    {"power_action", "power", 1},       {"power_action", "power", 0},
    {"start_action", "start", 0},       {"stop_action", "stop", 0},
    {"continue_action", "continue", 0}, {"start_action", "start", 2},
    {"start_action", "start", 6}};

Controller::Controller(CloudApi *api, Clock *clock, Log *log, Storage *storage)
    : api_(api), clock_(clock), log_(log), storage_(storage), resolver_(log),
      pauseTracker_(RelayConfig().pauseWindowMs) {}

Controller::~Controller() {
  // Interfaces are not owned, don't delete
}

bool Controller::begin() {
  logPrintf(log_, LogLevel::INFO, TAG, "Starting...");

  if (storage_ && !storage_->begin()) {
    logPrintf(log_, LogLevel::ERROR, TAG, "Storage unavailable, using defaults");
    return false;
  }

  loadConfig();

  RelayConfig cfg = getConfig();
  logPrintf(log_, LogLevel::INFO, TAG,
            "Ready. attempts=%u retry=%lums settle=%lums cooldown=%lums",
            static_cast<unsigned>(cfg.maxAttempts),
            static_cast<unsigned long>(cfg.retryDelayMs),
            static_cast<unsigned long>(cfg.settleDelayMs),
            static_cast<unsigned long>(cfg.pollCooldownMs));
  return true;
}

void Controller::setConfig(const RelayConfig &config) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_ = config;
  if (config_.maxAttempts == 0)
    config_.maxAttempts = 1;
  pauseTracker_.setWindow(config_.pauseWindowMs);
}

RelayConfig Controller::getConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return config_;
}

bool Controller::loadConfig() {
  if (!storage_)
    return false;

  RelayConfig cfg = getConfig();
  uint32_t value = 0;

  if (storage_->readU32("max_attempts", value) && value >= 1 && value <= 255)
    cfg.maxAttempts = static_cast<uint8_t>(value);
  if (storage_->readU32("retry_ms", value))
    cfg.retryDelayMs = value;
  if (storage_->readU32("settle_ms", value))
    cfg.settleDelayMs = value;
  if (storage_->readU32("cooldown_ms", value))
    cfg.pollCooldownMs = value;
  if (storage_->readU32("pause_ms", value) && value > 0)
    cfg.pauseWindowMs = value;
  if (storage_->readU32("relay_tc", value) && value <= 0xFFFF)
    cfg.relayTypeCode = static_cast<uint16_t>(value);

  setConfig(cfg);
  return true;
}

bool Controller::saveConfig() {
  if (!storage_)
    return false;

  RelayConfig cfg = getConfig();
  bool ok = storage_->writeU32("max_attempts", cfg.maxAttempts) &&
            storage_->writeU32("retry_ms", cfg.retryDelayMs) &&
            storage_->writeU32("settle_ms", cfg.settleDelayMs) &&
            storage_->writeU32("cooldown_ms", cfg.pollCooldownMs) &&
            storage_->writeU32("pause_ms", cfg.pauseWindowMs) &&
            storage_->writeU32("relay_tc", cfg.relayTypeCode);

  if (ok)
    ok = storage_->commit();
  if (!ok)
    logPrintf(log_, LogLevel::ERROR, TAG, "Failed to save configuration");
  return ok;
}

bool Controller::resetConfig() {
  setConfig(RelayConfig());
  if (!storage_)
    return false;

  static const char *KEYS[] = {"max_attempts", "retry_ms",  "settle_ms",
                               "cooldown_ms",  "pause_ms",  "relay_tc"};
  bool ok = true;
  for (const char *key : KEYS)
    ok = storage_->erase(key) && ok;
  if (ok)
    ok = storage_->commit();
  if (!ok)
    logPrintf(log_, LogLevel::ERROR, TAG, "Failed to reset configuration");
  return ok;
}

std::mutex &Controller::applianceLock(DeviceId id) {
  std::lock_guard<std::mutex> lock(locksMutex_);
  std::unique_ptr<std::mutex> &slot = locks_[id];
  if (!slot)
    slot.reset(new std::mutex());
  return *slot;
}

ControlError Controller::fromApiStatus(ApiStatus status) {
  switch (status) {
  case ApiStatus::OK:
    return ControlError::NONE;
  case ApiStatus::AUTH_ERROR:
    return ControlError::UPSTREAM_AUTH;
  case ApiStatus::SERVER_ERROR:
    return ControlError::UPSTREAM_SERVER;
  case ApiStatus::BLUETOOTH_ERROR:
    return ControlError::BLUETOOTH_LINK_FAILED;
  case ApiStatus::TIMEOUT:
  case ApiStatus::TRANSPORT_ERROR:
    return ControlError::UPSTREAM_TRANSPORT;
  }
  return ControlError::UPSTREAM_TRANSPORT;
}

ControlError Controller::fromSessionResult(SessionResult result) {
  switch (result) {
  case SessionResult::OK:
    return ControlError::NONE;
  case SessionResult::LINK_FAILED:
  case SessionResult::FRAME_FAILED:
    return ControlError::BLUETOOTH_LINK_FAILED;
  case SessionResult::ENCODE_FAILED:
    return ControlError::MISSING_DEVICE_STATE;
  case SessionResult::UPSTREAM_AUTH:
    return ControlError::UPSTREAM_AUTH;
  case SessionResult::UPSTREAM_SERVER:
    return ControlError::UPSTREAM_SERVER;
  case SessionResult::CANCELLED:
    return ControlError::CANCELLED;
  }
  return ControlError::BLUETOOTH_LINK_FAILED;
}

void Controller::fillRelayInfo(DeviceId id, const RelayConfig &config,
                               FountainPublicState &out) {
  RelayRecord rec = resolver_.record(id);
  out.relayDecision = rec.lastDecision;
  if (rec.lastDecision != RelayDecision::AVAILABLE) {
    out.relayTypeCode = 0;
    return;
  }
  out.relayTypeCode =
      config.relayTypeCode != 0 ? config.relayTypeCode : rec.relayTypeCode;
}

ControlError Controller::refreshFountain(DeviceId id, FountainPublicState &out,
                                         const CancelToken *cancel) {
  std::lock_guard<std::mutex> lock(applianceLock(id));
  RelayConfig cfg = getConfig();
  out = FountainPublicState();

  FountainState snapshot;
  ApiStatus status = api_->fetchFountain(id, snapshot);
  if (status != ApiStatus::OK)
    return fromApiStatus(status);
  out.device = snapshot;

  // Relay activation too often locks up the fountain firmware
  if (!resolver_.pollAllowed(id, clock_->nowMs(), cfg.pollCooldownMs)) {
    fillRelayInfo(id, cfg, out);
    return ControlError::NONE;
  }

  DeviceRoster roster;
  status = api_->fetchRoster(roster);
  if (status != ApiStatus::OK)
    return fromApiStatus(status);

  RelayLink link;
  link.bleId = id;
  link.mac = snapshot.mac;
  RelaySession session(*api_, *clock_, resolver_, cfg, link, log_, cancel);

  RelayDecision decision = session.resolveRelay(roster, status);
  if (status == ApiStatus::AUTH_ERROR || status == ApiStatus::SERVER_ERROR)
    return fromApiStatus(status);

  out.relayDecision = decision;
  if (decision != RelayDecision::AVAILABLE)
    return ControlError::NONE;
  out.relayTypeCode = session.link().typeCode;

  FountainState refreshed;
  ApiStatus refetchStatus = ApiStatus::TRANSPORT_ERROR;
  SessionResult result = session.runRefresh(
      [&]() { refetchStatus = api_->fetchFountain(id, refreshed); });

  if (result == SessionResult::LINK_FAILED) {
    // Stale cloud data is still a valid answer for a refresh
    return ControlError::NONE;
  }

  if (refetchStatus == ApiStatus::OK) {
    out.device = refreshed;
    out.linkRefreshed = true;
  }

  if (result != SessionResult::OK)
    return fromSessionResult(result);
  if (refetchStatus != ApiStatus::OK)
    return fromApiStatus(refetchStatus);
  return ControlError::NONE;
}

ControlError Controller::checkPreconditions(const FountainPublicState &fountain,
                                            FountainCommand &cmd) {
  const FountainState &dev = fountain.device;

  switch (cmd) {
  case FountainCommand::PAUSE:
    if (dev.powerStatus == 0) {
      logPrintf(log_, LogLevel::WARN, TAG, "%s is already paused.",
                dev.name.c_str());
      return ControlError::INVALID_COMMAND_FOR_STATE;
    }
    cmd = (dev.mode == 1) ? FountainCommand::NORMAL_TO_PAUSE
                          : FountainCommand::SMART_TO_PAUSE;
    return ControlError::NONE;
  case FountainCommand::HANDSHAKE_FIRST:
  case FountainCommand::HANDSHAKE_SECOND:
    // Handshake frames belong to the refresh cycle
    return ControlError::INVALID_COMMAND_FOR_STATE;
  case FountainCommand::LIGHT_LOW:
  case FountainCommand::LIGHT_MEDIUM:
  case FountainCommand::LIGHT_HIGH:
    if (!dev.hasSettings)
      return ControlError::MISSING_DEVICE_STATE;
    if (dev.settings.lampSwitch == 0) {
      logPrintf(log_, LogLevel::WARN, TAG,
                "Cannot set brightness on %s while the light is off.",
                dev.name.c_str());
      return ControlError::INVALID_COMMAND_FOR_STATE;
    }
    return ControlError::NONE;
  case FountainCommand::LIGHT_ON:
  case FountainCommand::LIGHT_OFF:
  case FountainCommand::DND_ON:
  case FountainCommand::DND_OFF:
    if (!dev.hasSettings)
      return ControlError::MISSING_DEVICE_STATE;
    return ControlError::NONE;
  case FountainCommand::NORMAL:
  case FountainCommand::SMART:
  case FountainCommand::NORMAL_TO_PAUSE:
  case FountainCommand::SMART_TO_PAUSE:
  case FountainCommand::RESET_FILTER:
    return ControlError::NONE;
  }
  return ControlError::INVALID_COMMAND_FOR_STATE;
}

ControlError Controller::sendFountainCommand(const FountainPublicState &fountain,
                                             FountainCommand cmd,
                                             const CancelToken *cancel) {
  FountainCommand resolved = cmd;
  ControlError err = checkPreconditions(fountain, resolved);
  if (err != ControlError::NONE)
    return err;

  DeviceId id = fountain.device.id;
  std::lock_guard<std::mutex> lock(applianceLock(id));
  RelayConfig cfg = getConfig();

  DeviceRoster roster;
  ApiStatus status = api_->fetchRoster(roster);
  if (status != ApiStatus::OK)
    return fromApiStatus(status);

  RelayLink link;
  link.bleId = id;
  link.mac = fountain.device.mac;
  RelaySession session(*api_, *clock_, resolver_, cfg, link, log_, cancel);

  RelayDecision decision = session.resolveRelay(roster, status);
  if (status == ApiStatus::AUTH_ERROR || status == ApiStatus::SERVER_ERROR)
    return fromApiStatus(status);
  if (decision != RelayDecision::AVAILABLE) {
    logPrintf(log_, LogLevel::WARN, TAG,
              "%s does not have a usable BLE relay (%s)",
              fountain.device.name.c_str(), relayDecisionName(decision));
    return ControlError::NO_RELAY_AVAILABLE;
  }

  const FountainSettings *settings =
      fountain.device.hasSettings ? &fountain.device.settings : nullptr;
  SessionResult result = session.runCommand(resolved, settings);

  if (result == SessionResult::OK) {
    logPrintf(log_, LogLevel::INFO, TAG, "Sent '%s' to %s",
              fountainCommandName(resolved), fountain.device.name.c_str());
  }
  return fromSessionResult(result);
}

const LitterBoxAction &Controller::litterBoxAction(LitterBoxCommand cmd) {
  return LITTER_ACTIONS[static_cast<uint8_t>(cmd)];
}

bool Controller::needsDualStageResume(LitterBoxModel model) {
  switch (model) {
  case LitterBoxModel::T3:
    return false;
  case LitterBoxModel::T4:
    return true;
  }
  return false;
}

ControlError Controller::refreshLitterBox(DeviceId id, LitterBoxModel model,
                                          LitterBoxPublicState &out) {
  std::lock_guard<std::mutex> lock(applianceLock(id));
  out = LitterBoxPublicState();

  ApiStatus status = api_->fetchLitterBox(id, model, out.device);
  if (status != ApiStatus::OK)
    return fromApiStatus(status);

  PauseState pause = pauseTracker_.state(id, clock_->nowMs());
  out.manuallyPaused = pause.paused;
  out.pauseEndsAtMs = pause.hasEnd ? pause.pauseEndsAtMs : 0;
  return ControlError::NONE;
}

ControlError Controller::finishDualStageStart(const LitterBoxState &box) {
  LitterEvent event;
  ApiStatus status = api_->fetchLatestLitterEvent(box.id, box.model, event);
  if (status != ApiStatus::OK) {
    logPrintf(log_, LogLevel::WARN, TAG, "%s: event record unavailable (%s)",
              box.name.c_str(), apiStatusName(status));
    return fromApiStatus(status);
  }

  bool pausedClean = event.type == LitterEvent::CLEAN_OVER &&
                     event.result == LitterEvent::PAUSED;
  if (pausedClean) {
    status = api_->controlLitterBox(
        box.id, box.model, litterBoxAction(LitterBoxCommand::RESUME_CLEAN));
    if (status != ApiStatus::OK) {
      logPrintf(log_, LogLevel::WARN, TAG, "%s: resume after start failed (%s)",
                box.name.c_str(), apiStatusName(status));
      return fromApiStatus(status);
    }
  }

  pauseTracker_.clear(box.id);
  return ControlError::NONE;
}

ControlError Controller::sendLitterBoxCommand(const LitterBoxState &box,
                                              LitterBoxCommand cmd) {
  std::lock_guard<std::mutex> lock(applianceLock(box.id));
  pauseTracker_.checkExpiry(box.id, clock_->nowMs());

  ApiStatus status =
      api_->controlLitterBox(box.id, box.model, litterBoxAction(cmd));
  if (status != ApiStatus::OK)
    return fromApiStatus(status);

  switch (cmd) {
  case LitterBoxCommand::PAUSE_CLEAN:
    pauseTracker_.notePause(box.id, clock_->nowMs());
    break;
  case LitterBoxCommand::RESUME_CLEAN:
    pauseTracker_.clear(box.id);
    break;
  case LitterBoxCommand::START_CLEAN:
    if (needsDualStageResume(box.model))
      return finishDualStageStart(box);
    pauseTracker_.clear(box.id);
    break;
  case LitterBoxCommand::POWER_ON:
  case LitterBoxCommand::POWER_OFF:
  case LitterBoxCommand::ODOR_REMOVAL:
  case LitterBoxCommand::RESET_DEODOR:
    break;
  }

  return ControlError::NONE;
}

bool Controller::isManuallyPaused(DeviceId id) {
  return pauseTracker_.isPaused(id, clock_->nowMs());
}

} // namespace PetLink
