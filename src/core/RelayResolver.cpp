/**
 * @file RelayResolver.cpp
 * @brief CORE:RelayResolver - Relay availability and poll cool-down
 */

#include "RelayResolver.h"

static const char *TAG = "RelayResolver";

namespace PetLink {

void RelayResolver::mergeRosterStatus(const DeviceRoster &roster,
                                      std::vector<RelayCandidate> &candidates) {
  for (RelayCandidate &candidate : candidates) {
    candidate.pim = 0;
    for (const RosterDevice &device : roster.devices) {
      if (device.id == candidate.id) {
        candidate.pim = device.pim;
        if (candidate.typeCode == 0)
          candidate.typeCode = device.typeCode;
        break;
      }
    }
  }
}

RelayDecision RelayResolver::resolve(DeviceId applianceId, bool groupHasRelay,
                                     const std::vector<RelayCandidate> &candidates,
                                     RelayCandidate *relayOut) {
  RelayDecision decision = RelayDecision::NO_RELAY_REPORTED;
  RelayCandidate chosen;

  // Only the main relay (first candidate) is considered
  if (groupHasRelay && !candidates.empty()) {
    const RelayCandidate &mainRelay = candidates.front();
    if (mainRelay.pim == PETLINK_PIM_ONLINE) {
      decision = RelayDecision::AVAILABLE;
      chosen = mainRelay;
    } else if (mainRelay.pim == PETLINK_PIM_ON_BATTERY) {
      decision = RelayDecision::MAIN_ON_BATTERY;
    } else {
      decision = RelayDecision::MAIN_OFFLINE;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  RelayRecord &rec = records_[applianceId];
  rec.lastDecision = decision;

  if (decision == RelayDecision::AVAILABLE) {
    rec.missingRelayWarned = false;
    rec.relayTypeCode = chosen.typeCode;
    if (relayOut)
      *relayOut = chosen;
    return decision;
  }
  rec.relayTypeCode = 0;

  // Accounts without any relay never had BLE; nothing to warn about
  if (!groupHasRelay || rec.missingRelayWarned)
    return decision;

  rec.missingRelayWarned = true;
  switch (decision) {
  case RelayDecision::MAIN_ON_BATTERY:
    logPrintf(log_, LogLevel::WARN, TAG,
              "Unable to use BLE relay for %llu: main relay is running on "
              "battery power. Fetching latest available data.",
              static_cast<unsigned long long>(applianceId));
    break;
  case RelayDecision::MAIN_OFFLINE:
    logPrintf(log_, LogLevel::WARN, TAG,
              "Unable to use BLE relay for %llu: main relay is reported as "
              "offline. Fetching latest available data.",
              static_cast<unsigned long long>(applianceId));
    break;
  case RelayDecision::NO_RELAY_REPORTED:
    logPrintf(log_, LogLevel::WARN, TAG,
              "No BLE relay reported for %llu. Fetching latest available data.",
              static_cast<unsigned long long>(applianceId));
    break;
  case RelayDecision::AVAILABLE:
    break;
  }

  return decision;
}

bool RelayResolver::pollAllowed(DeviceId applianceId, uint64_t nowMs,
                                uint32_t cooldownMs) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(applianceId);
  if (it == records_.end() || !it->second.hasPolled)
    return true;

  const RelayRecord &rec = it->second;
  if (nowMs < rec.lastSuccessfulPollMs)
    return false;
  return nowMs - rec.lastSuccessfulPollMs >= cooldownMs;
}

void RelayResolver::notePollSuccess(DeviceId applianceId, uint64_t nowMs) {
  std::lock_guard<std::mutex> lock(mutex_);
  RelayRecord &rec = records_[applianceId];
  rec.hasPolled = true;
  rec.lastSuccessfulPollMs = nowMs;
}

RelayRecord RelayResolver::record(DeviceId applianceId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(applianceId);
  if (it == records_.end())
    return RelayRecord();
  return it->second;
}

} // namespace PetLink
