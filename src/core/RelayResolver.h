/**
 * @file RelayResolver.h
 * @brief CORE:RelayResolver - Relay availability and poll cool-down
 * @version 1.0.0
 *
 * Keeps one RelayRecord per appliance for the lifetime of the process.
 */
#pragma once
#include "../interfaces/Log.h"
#include "Types.h"
#include <map>
#include <mutex>
#include <vector>

namespace PetLink {

/**
 * @struct RelayRecord
 * @brief Per-appliance availability bookkeeping
 */
struct RelayRecord {
  bool hasPolled = false;
  uint64_t lastSuccessfulPollMs = 0;
  bool missingRelayWarned = false;
  RelayDecision lastDecision = RelayDecision::NO_RELAY_REPORTED;
  uint16_t relayTypeCode = 0; // type code of the last usable relay
};

/**
 * @class RelayResolver
 * @brief Decides whether a BLE session may start for an appliance
 */
class RelayResolver {
public:
  explicit RelayResolver(Log *log = nullptr) : log_(log) {}

  /**
   * @brief Copy each candidate's pim from the matching roster entry
   * The roster typeCode is used when the listing carried none.
   * @param roster Device roster
   * @param candidates Relay listing, updated in place
   */
  static void mergeRosterStatus(const DeviceRoster &roster,
                                std::vector<RelayCandidate> &candidates);

  /**
   * @brief Classify relay availability for one appliance
   *
   * Warns once per unavailability streak; the flag clears on the next
   * AVAILABLE result.
   *
   * @param applianceId Appliance the session would target
   * @param groupHasRelay Roster hasRelay flag
   * @param candidates Relay listing with pim merged, main relay first
   * @param relayOut The main relay when AVAILABLE (may be nullptr)
   */
  RelayDecision resolve(DeviceId applianceId, bool groupHasRelay,
                        const std::vector<RelayCandidate> &candidates,
                        RelayCandidate *relayOut = nullptr);

  /**
   * @brief True if no poll happened yet or the cool-down has elapsed
   */
  bool pollAllowed(DeviceId applianceId, uint64_t nowMs,
                   uint32_t cooldownMs) const;

  void notePollSuccess(DeviceId applianceId, uint64_t nowMs);

  /// @brief Snapshot of a record (default record if never seen)
  RelayRecord record(DeviceId applianceId) const;

private:
  Log *log_;
  mutable std::mutex mutex_;
  std::map<DeviceId, RelayRecord> records_;
};

} // namespace PetLink
