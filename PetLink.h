/**
 * @file PetLink.h
 * @brief Unified PetLink library include
 *
 * This is the main entry point for the PetLink library.
 * Include this file and instantiate your preferred drivers.
 *
 * @example Basic usage:
 * @code
 * #include <PetLink.h>
 * using namespace PetLink;
 *
 * MyTokenProvider tokens;
 * HTTPCloudApi cloud(PETLINK_REGION_US, &tokens);
 * ESP32Clock sysClock;
 * ESPLog espLog;
 * NVSStorage storage;
 *
 * Controller petlink(&cloud, &sysClock, &espLog, &storage);
 *
 * void setup() {
 *   petlink.begin();
 * }
 *
 * void loop() {
 *   FountainPublicState fountain;
 *   if (petlink.refreshFountain(FOUNTAIN_ID, fountain) == ControlError::NONE)
 *     petlink.sendFountainCommand(fountain, FountainCommand::LIGHT_ON);
 * }
 * @endcode
 */

#pragma once

// Interfaces
#include "src/interfaces/Clock.h"
#include "src/interfaces/CloudApi.h"
#include "src/interfaces/Log.h"
#include "src/interfaces/Storage.h"
#include "src/interfaces/TokenProvider.h"

// Core
#include "src/core/Codec.h"
#include "src/core/Frame.h"
#include "src/core/PauseTracker.h"
#include "src/core/RelayResolver.h"
#include "src/core/RelaySession.h"
#include "src/core/Types.h"

// ESP32 Drivers (optional - user can provide their own)
#ifdef ESP32
#include "src/drivers/ESP32Clock.h"
#include "src/drivers/ESPLog.h"
#include "src/drivers/HTTPCloudApi.h"
#include "src/drivers/NVSStorage.h"
#endif

#include <map>
#include <memory>
#include <mutex>

namespace PetLink {

/**
 * @brief Main PetLink controller - orchestrates all components
 *
 * Owns the per-appliance state (relay records, manual pauses) and one
 * session lock per appliance. Calls for different appliances may run on
 * different tasks; calls for the same appliance are serialized.
 */
class Controller {
public:
  /**
   * @brief Construct with injected dependencies
   * @param api Cloud access (required)
   * @param clock Time source (required)
   * @param log Log sink (optional, can be nullptr)
   * @param storage Configuration storage (optional, can be nullptr)
   */
  Controller(CloudApi *api, Clock *clock, Log *log = nullptr,
             Storage *storage = nullptr);
  ~Controller();

  /**
   * @brief Open storage and load the persisted configuration
   * @return false if storage failed to open
   */
  bool begin();

  void setConfig(const RelayConfig &config);
  RelayConfig getConfig() const;

  /**
   * @brief Read relay configuration keys from storage
   * Missing or out-of-range keys keep their current value.
   * @return true if storage is available
   */
  bool loadConfig();

  /// @brief Persist current configuration
  bool saveConfig();

  /// @brief Erase persisted keys and fall back to defaults
  bool resetConfig();

  /**
   * @brief Refresh a W5 fountain, through the BLE relay when allowed
   *
   * Falls back to the cloud snapshot when the poll cool-down is active,
   * no relay is usable, or the link cannot be opened. Only upstream
   * errors and cancellation are reported.
   *
   * @param id Fountain id
   * @param out Public state
   * @param cancel Optional cancellation flag
   */
  ControlError refreshFountain(DeviceId id, FountainPublicState &out,
                               const CancelToken *cancel = nullptr);

  /**
   * @brief Send one command to a W5 fountain through the relay
   *
   * Preconditions are checked against the given snapshot before any
   * network call. PAUSE is resolved from the current mode.
   *
   * @param fountain Last known public state
   * @param cmd Command
   * @param cancel Optional cancellation flag
   */
  ControlError sendFountainCommand(const FountainPublicState &fountain,
                                   FountainCommand cmd,
                                   const CancelToken *cancel = nullptr);

  /**
   * @brief Refresh a litter box and its manual pause flag
   * @param id Litter box id
   * @param model Device generation
   * @param out Public state
   */
  ControlError refreshLitterBox(DeviceId id, LitterBoxModel model,
                                LitterBoxPublicState &out);

  /**
   * @brief Send a litter box command and update the manual pause
   *
   * START_CLEAN on dual-stage models is followed by RESUME_CLEAN when
   * the newest event shows a paused clean.
   */
  ControlError sendLitterBoxCommand(const LitterBoxState &box,
                                    LitterBoxCommand cmd);

  /// @brief Manual pause flag after lazy expiry
  bool isManuallyPaused(DeviceId id);

  static const LitterBoxAction &litterBoxAction(LitterBoxCommand cmd);
  static bool needsDualStageResume(LitterBoxModel model);
  static ControlError fromApiStatus(ApiStatus status);
  static ControlError fromSessionResult(SessionResult result);

  RelayResolver &getResolver() { return resolver_; }
  PauseTracker &getPauseTracker() { return pauseTracker_; }

private:
  CloudApi *api_;
  Clock *clock_;
  Log *log_;
  Storage *storage_;

  RelayResolver resolver_;
  PauseTracker pauseTracker_;

  mutable std::mutex configMutex_;
  RelayConfig config_;

  std::mutex locksMutex_;
  std::map<DeviceId, std::unique_ptr<std::mutex>> locks_;

  /** @brief Session slot for one appliance, created on first use */
  std::mutex &applianceLock(DeviceId id);

  /** @brief Reject commands the snapshot says cannot apply */
  ControlError checkPreconditions(const FountainPublicState &fountain,
                                  FountainCommand &cmd);

  /** @brief Issue RESUME_CLEAN after START_CLEAN when the device paused */
  ControlError finishDualStageStart(const LitterBoxState &box);

  void fillRelayInfo(DeviceId id, const RelayConfig &config,
                     FountainPublicState &out);
};

} // namespace PetLink
