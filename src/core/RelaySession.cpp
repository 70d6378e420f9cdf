/**
 * @file RelaySession.cpp
 * @brief CORE:RelaySession - Cloud-mediated BLE session state machine
 */

#include "RelaySession.h"
#include "Codec.h"
#include "Frame.h"

static const char *TAG = "RelaySession";

namespace PetLink {

const char *sessionStateName(SessionState state) {
  switch (state) {
  case SessionState::IDLE:
    return "IDLE";
  case SessionState::RESOLVING_RELAY:
    return "RESOLVING_RELAY";
  case SessionState::CONNECTING:
    return "CONNECTING";
  case SessionState::POLLING:
    return "POLLING";
  case SessionState::HANDSHAKE_OR_COMMAND:
    return "HANDSHAKE_OR_COMMAND";
  case SessionState::DISCONNECTING:
    return "DISCONNECTING";
  case SessionState::FAILED:
    return "FAILED";
  }
  return "?";
}

RelaySession::RelaySession(CloudApi &api, Clock &clock, RelayResolver &resolver,
                           const RelayConfig &config, const RelayLink &link,
                           Log *log, const CancelToken *cancel)
    : api_(api), clock_(clock), resolver_(resolver), config_(config),
      link_(link), log_(log), cancel_(cancel) {
  if (config_.maxAttempts == 0)
    config_.maxAttempts = 1;
}

RelaySession::~RelaySession() {
  if (state_ != SessionState::IDLE || connected_)
    close();
}

void RelaySession::transition(SessionState next) {
  logPrintf(log_, LogLevel::DEBUG, TAG, "%llu: %s -> %s",
            static_cast<unsigned long long>(link_.bleId),
            sessionStateName(state_), sessionStateName(next));
  state_ = next;
}

bool RelaySession::cancelled() const {
  return cancel_ != nullptr && cancel_->load();
}

RelayDecision RelaySession::resolveRelay(const DeviceRoster &roster,
                                         ApiStatus &status) {
  transition(SessionState::RESOLVING_RELAY);
  status = ApiStatus::OK;

  std::vector<RelayCandidate> candidates;
  if (roster.hasRelay) {
    status = api_.listRelayCandidates(candidates);
    if (status != ApiStatus::OK) {
      logPrintf(log_, LogLevel::WARN, TAG, "Relay listing failed: %s",
                apiStatusName(status));
      candidates.clear();
    }
    RelayResolver::mergeRosterStatus(roster, candidates);
  }

  RelayCandidate relay;
  RelayDecision decision =
      resolver_.resolve(link_.bleId, roster.hasRelay, candidates, &relay);

  if (decision != RelayDecision::AVAILABLE) {
    transition(SessionState::IDLE);
    return decision;
  }

  link_.typeCode =
      config_.relayTypeCode != 0 ? config_.relayTypeCode : relay.typeCode;
  logPrintf(log_, LogLevel::DEBUG, TAG, "%llu: relay %llu type %u",
            static_cast<unsigned long long>(link_.bleId),
            static_cast<unsigned long long>(relay.id),
            static_cast<unsigned>(link_.typeCode));
  return decision;
}

SessionResult RelaySession::retryStep(SessionState step, uint16_t &attempts) {
  for (uint8_t attempt = 1; attempt <= config_.maxAttempts; attempt++) {
    if (cancelled())
      return SessionResult::CANCELLED;

    int value = -1;
    ApiStatus status = (step == SessionState::CONNECTING)
                           ? api_.bleConnect(link_, value)
                           : api_.blePoll(link_, value);
    attempts++;

    if (status == ApiStatus::OK) {
      bool ok = (step == SessionState::CONNECTING) ? (value == 1) : (value == 0);
      if (ok)
        return SessionResult::OK;
    }

    // Credential and outage errors belong to the HTTP layer, no retry here
    if (status == ApiStatus::AUTH_ERROR)
      return SessionResult::UPSTREAM_AUTH;
    if (status == ApiStatus::SERVER_ERROR)
      return SessionResult::UPSTREAM_SERVER;

    logPrintf(log_, LogLevel::WARN, TAG,
              "%llu: %s attempt %u/%u failed (%s, %d)",
              static_cast<unsigned long long>(link_.bleId),
              sessionStateName(step),
              static_cast<unsigned>(attempt),
              static_cast<unsigned>(config_.maxAttempts), apiStatusName(status),
              value);

    if (attempt < config_.maxAttempts)
      clock_.delayMs(config_.retryDelayMs);
  }

  return SessionResult::LINK_FAILED;
}

SessionResult RelaySession::open() {
  transition(SessionState::CONNECTING);
  SessionResult result = retryStep(SessionState::CONNECTING, connectAttempts_);
  if (result != SessionResult::OK) {
    if (result == SessionResult::LINK_FAILED) {
      logPrintf(log_, LogLevel::WARN, TAG,
                "BLE connection to %llu failed. Will try again later.",
                static_cast<unsigned long long>(link_.bleId));
    }
    transition(SessionState::FAILED);
    return result;
  }
  connected_ = true;

  transition(SessionState::POLLING);
  result = retryStep(SessionState::POLLING, pollAttempts_);
  if (result != SessionResult::OK) {
    if (result == SessionResult::LINK_FAILED) {
      logPrintf(log_, LogLevel::WARN, TAG,
                "BLE polling to %llu failed. Will try again later.",
                static_cast<unsigned long long>(link_.bleId));
    }
    transition(SessionState::FAILED);
    return result;
  }

  linkOpen_ = true;
  resolver_.notePollSuccess(link_.bleId, clock_.nowMs());

  // Relay acknowledges the poll before the BLE link accepts writes
  transition(SessionState::HANDSHAKE_OR_COMMAND);
  clock_.delayMs(config_.settleDelayMs);
  return SessionResult::OK;
}

SessionResult RelaySession::sendFrame(FountainCommand cmd,
                                      const std::vector<int> &payload) {
  std::vector<uint8_t> frame =
      Frame::build(Codec::opcodeFor(cmd), sequence_, payload);
  std::string data = Codec::encodeFrameString(frame);

  ApiStatus status = api_.bleControl(link_, Codec::commandCode(cmd), data);
  sequence_++;

  switch (status) {
  case ApiStatus::OK:
    return SessionResult::OK;
  case ApiStatus::AUTH_ERROR:
    return SessionResult::UPSTREAM_AUTH;
  case ApiStatus::SERVER_ERROR:
    return SessionResult::UPSTREAM_SERVER;
  case ApiStatus::BLUETOOTH_ERROR:
  case ApiStatus::TIMEOUT:
  case ApiStatus::TRANSPORT_ERROR:
    break;
  }

  logPrintf(log_, LogLevel::WARN, TAG, "%llu: frame '%s' rejected (%s)",
            static_cast<unsigned long long>(link_.bleId),
            fountainCommandName(cmd), apiStatusName(status));
  return SessionResult::FRAME_FAILED;
}

SessionResult RelaySession::handshake() {
  if (sequence_ != 0)
    sequence_ = 1;

  std::vector<int> empty;
  SessionResult result = sendFrame(FountainCommand::HANDSHAKE_FIRST, empty);
  if (result != SessionResult::OK)
    return result;
  return sendFrame(FountainCommand::HANDSHAKE_SECOND, empty);
}

SessionResult RelaySession::sendCommand(FountainCommand cmd,
                                        const FountainSettings *settings) {
  std::vector<int> payload;
  CodecStatus status = Codec::buildPayload(cmd, settings, payload);
  if (status != CodecStatus::OK) {
    logPrintf(log_, LogLevel::ERROR, TAG, "Cannot encode '%s' (%d)",
              fountainCommandName(cmd), static_cast<int>(status));
    return SessionResult::ENCODE_FAILED;
  }
  return sendFrame(cmd, payload);
}

void RelaySession::close() {
  // A cancelled caller still gets its half-open link torn down
  bool needsCancel = linkOpen_ || (connected_ && cancelled());

  if (needsCancel) {
    transition(SessionState::DISCONNECTING);
    clock_.delayMs(config_.settleDelayMs);
    ApiStatus status = api_.bleCancel(link_);
    if (status != ApiStatus::OK) {
      logPrintf(log_, LogLevel::WARN, TAG, "%llu: disconnect failed (%s)",
                static_cast<unsigned long long>(link_.bleId),
                apiStatusName(status));
    }
  }

  linkOpen_ = false;
  connected_ = false;
  sequence_ = 0;
  transition(SessionState::IDLE);
}

SessionResult RelaySession::runRefresh(const std::function<void()> &refetch) {
  SessionResult result = open();
  if (result != SessionResult::OK) {
    close();
    return result;
  }

  result = cancelled() ? SessionResult::CANCELLED : handshake();
  if (result == SessionResult::FRAME_FAILED) {
    logPrintf(log_, LogLevel::DEBUG, TAG, "%llu: handshake failed, ignored",
              static_cast<unsigned long long>(link_.bleId));
    result = SessionResult::OK;
  }

  if (refetch)
    refetch();

  close();
  return result;
}

SessionResult RelaySession::runCommand(FountainCommand cmd,
                                       const FountainSettings *settings) {
  SessionResult result = open();
  if (result != SessionResult::OK) {
    close();
    return result;
  }

  result = cancelled() ? SessionResult::CANCELLED : sendCommand(cmd, settings);
  close();
  return result;
}

} // namespace PetLink
