/**
 * @file CloudApi.h
 * @brief PetLink::CloudApi - Vendor cloud relay layer
 * @version 1.0.0
 *
 * Endpoints: ble/ownSupportBleDevices, ble/connect, ble/poll, ble/cancel,
 * ble/controlDevice, discovery/device_roster, w5/deviceData,
 * <model>/device_detail, <model>/controlDevice, getDeviceRecord
 */
#pragma once
#include "../core/Types.h"
#include <string>
#include <vector>

namespace PetLink {

/**
 * @interface CloudApi
 * @brief Request/response access to the vendor cloud
 *
 * Implementations map JSON to the structures in Types.h and vendor error
 * payloads to ApiStatus. Each call blocks until the response or its own
 * timeout (reported as ApiStatus::TIMEOUT).
 */
class CloudApi {
public:
  virtual ~CloudApi() = default;

  /**
   * @brief Fetch the account device roster
   * @param out Roster incl. hasRelay flag and per-device pim
   */
  virtual ApiStatus fetchRoster(DeviceRoster &out) = 0;

  /**
   * @brief List appliances able to act as BLE relay
   * @param out Candidates, main relay first (pim left at 0)
   */
  virtual ApiStatus listRelayCandidates(std::vector<RelayCandidate> &out) = 0;

  /**
   * @brief Read the fountain state stored in the cloud
   * @param id Fountain id
   * @param out Snapshot
   */
  virtual ApiStatus fetchFountain(DeviceId id, FountainState &out) = 0;

  /**
   * @brief Ask the relay to open a BLE link
   * @param link Relay identifiers
   * @param state Remote state, 1 = connected
   */
  virtual ApiStatus bleConnect(const RelayLink &link, int &state) = 0;

  /**
   * @brief Poll the opened link
   * @param link Relay identifiers
   * @param result Remote result, 0 = ready
   */
  virtual ApiStatus blePoll(const RelayLink &link, int &result) = 0;

  /**
   * @brief Close the link
   * @param link Relay identifiers
   */
  virtual ApiStatus bleCancel(const RelayLink &link) = 0;

  /**
   * @brief Send one encoded frame through the relay
   * @param link Relay identifiers
   * @param commandCode Unsigned opcode (215, 216, 220, 221, 222)
   * @param data Frame as returned by Codec::encodeFrameString
   */
  virtual ApiStatus bleControl(const RelayLink &link, uint8_t commandCode,
                               const std::string &data) = 0;

  virtual ApiStatus fetchLitterBox(DeviceId id, LitterBoxModel model,
                                   LitterBoxState &out) = 0;

  virtual ApiStatus controlLitterBox(DeviceId id, LitterBoxModel model,
                                     const LitterBoxAction &action) = 0;

  /**
   * @brief Read the newest entry of the litter box event record
   * @param id Litter box id
   * @param model Device generation
   * @param out Event type and result
   */
  virtual ApiStatus fetchLatestLitterEvent(DeviceId id, LitterBoxModel model,
                                           LitterEvent &out) = 0;
};

} // namespace PetLink
