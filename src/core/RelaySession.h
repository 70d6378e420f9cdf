/**
 * @file RelaySession.h
 * @brief CORE:RelaySession - Cloud-mediated BLE session state machine
 * @version 1.0.0
 *
 * IDLE -> RESOLVING_RELAY -> CONNECTING -> POLLING -> HANDSHAKE_OR_COMMAND
 *      -> DISCONNECTING -> IDLE, with FAILED when connect/poll run out of
 * attempts. One instance per refresh or command; the caller holds the
 * appliance lock for the whole lifetime.
 */
#pragma once
#include "../interfaces/CloudApi.h"
#include "../interfaces/Clock.h"
#include "../interfaces/Log.h"
#include "RelayResolver.h"
#include "Types.h"
#include <atomic>
#include <functional>

namespace PetLink {

using CancelToken = std::atomic<bool>;

enum class SessionState : uint8_t {
  IDLE,
  RESOLVING_RELAY,
  CONNECTING,
  POLLING,
  HANDSHAKE_OR_COMMAND,
  DISCONNECTING,
  FAILED
};

/**
 * @enum SessionResult
 * @brief Outcome of a session step
 */
enum class SessionResult : uint8_t {
  OK = 0,
  LINK_FAILED,  ///< connect or poll ran out of attempts
  FRAME_FAILED, ///< relay rejected a frame
  ENCODE_FAILED,
  UPSTREAM_AUTH,
  UPSTREAM_SERVER,
  CANCELLED
};

/**
 * @class RelaySession
 * @brief Drives one connect/poll/frames/disconnect cycle
 */
class RelaySession {
public:
  /**
   * @param api Cloud access
   * @param clock Time source for retry and settle waits
   * @param resolver Shared availability records
   * @param config Attempts and delays
   * @param link bleId and mac of the appliance; typeCode set by resolveRelay
   * @param log Optional log sink
   * @param cancel Optional cancellation flag
   */
  RelaySession(CloudApi &api, Clock &clock, RelayResolver &resolver,
               const RelayConfig &config, const RelayLink &link,
               Log *log = nullptr, const CancelToken *cancel = nullptr);

  /// Closes a still-open link
  ~RelaySession();

  RelaySession(const RelaySession &) = delete;
  RelaySession &operator=(const RelaySession &) = delete;

  /**
   * @brief IDLE -> RESOLVING_RELAY -> (CONNECTING-ready | IDLE)
   * @param roster Current roster (hasRelay flag and pim per device)
   * @param status Status of the relay listing call
   * @return AVAILABLE leaves the session ready for open()
   */
  RelayDecision resolveRelay(const DeviceRoster &roster, ApiStatus &status);

  /**
   * @brief CONNECTING -> POLLING, bounded retries on each step
   * @return OK when the relay link is ready for frames
   */
  SessionResult open();

  /**
   * @brief Send the two handshake frames (sequence N, N+1)
   * @return FRAME_FAILED if the relay rejected either frame
   */
  SessionResult handshake();

  /**
   * @brief Encode and send one command frame at the current sequence
   * @param cmd Resolved command
   * @param settings Snapshot for settings-class commands
   */
  SessionResult sendCommand(FountainCommand cmd,
                            const FountainSettings *settings);

  /**
   * @brief DISCONNECTING -> IDLE, resets the sequence to 0
   *
   * Skips the cancel call if the link never opened. Cancel failures are
   * only logged.
   */
  void close();

  /**
   * @brief Full refresh cycle
   *
   * Handshake errors are swallowed; refetch runs whenever the link
   * opened, before the link is closed.
   *
   * @param refetch Reads the latest state from the cloud
   */
  SessionResult runRefresh(const std::function<void()> &refetch);

  /**
   * @brief Full command cycle, frame failure surfaced
   */
  SessionResult runCommand(FountainCommand cmd,
                           const FountainSettings *settings);

  SessionState state() const { return state_; }
  uint8_t sequence() const { return sequence_; }
  const RelayLink &link() const { return link_; }
  uint16_t connectAttempts() const { return connectAttempts_; }
  uint16_t pollAttempts() const { return pollAttempts_; }
  bool linkOpen() const { return linkOpen_; }

private:
  CloudApi &api_;
  Clock &clock_;
  RelayResolver &resolver_;
  RelayConfig config_;
  RelayLink link_;
  Log *log_;
  const CancelToken *cancel_;

  SessionState state_ = SessionState::IDLE;
  uint8_t sequence_ = 0;
  uint16_t connectAttempts_ = 0;
  uint16_t pollAttempts_ = 0;
  bool connected_ = false;
  bool linkOpen_ = false;

  void transition(SessionState next);
  bool cancelled() const;
  SessionResult retryStep(SessionState step, uint16_t &attempts);
  SessionResult sendFrame(FountainCommand cmd, const std::vector<int> &payload);
};

const char *sessionStateName(SessionState state);

} // namespace PetLink
