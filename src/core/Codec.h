/**
 * @file Codec.h
 * @brief CORE:Codec - W5 command payloads and transport encoding
 * @version 1.0.0
 *
 * Turns a FountainCommand (plus the live settings block when needed) into
 * the payload the fountain firmware expects, and wraps finished frames as
 * base64 + percent-encoding for the cloud relay.
 */
#pragma once
#include "Types.h"
#include <array>
#include <string>
#include <vector>

namespace PetLink {

/**
 * @enum CodecStatus
 * @brief Payload build outcome
 */
enum class CodecStatus : uint8_t {
  OK = 0,
  MISSING_DEVICE_STATE, ///< settings command without a settings snapshot
  UNRESOLVED_COMMAND    ///< PAUSE must be resolved to a mode transition first
};

/**
 * @class Codec
 * @brief Stateless encoding helpers
 */
class Codec {
public:
  /**
   * @brief Split a 16-bit value, high byte first
   * @param value Value to pack
   * @return {hi, lo}
   */
  static std::array<uint8_t, 2> encodeShort(uint16_t value);

  static uint16_t decodeShort(uint8_t hi, uint8_t lo);

  /// @brief Signed opcode as documented for the firmware
  static int opcodeFor(FountainCommand cmd);

  /// @brief Opcode residue sent as the cloud "cmd" field
  static uint8_t commandCode(FountainCommand cmd);

  /// @brief Light power, brightness and do-not-disturb commands
  static bool isSettingsCommand(FountainCommand cmd);

  /**
   * @brief Build the 13 element settings block
   *
   * Every field is echoed from the snapshot except the one the command
   * writes; omitted fields are reset by the firmware.
   *
   * @param cmd Settings-class command
   * @param settings Current snapshot, nullptr if unknown
   * @param out Payload
   */
  static CodecStatus buildSettingsPayload(FountainCommand cmd,
                                          const FountainSettings *settings,
                                          std::vector<int> &out);

  /**
   * @brief Build the payload for any resolved command
   * @param cmd Command
   * @param settings Current snapshot, only read for settings commands
   * @param out Payload (empty for handshake and filter reset)
   */
  static CodecStatus buildPayload(FountainCommand cmd,
                                  const FountainSettings *settings,
                                  std::vector<int> &out);

  /**
   * @brief base64, then percent-encode everything but A-Z a-z 0-9 - _ . ~
   */
  static std::string encodeFrameString(const std::vector<uint8_t> &frame);

  /**
   * @brief Inverse of encodeFrameString
   * @return false on malformed escapes or base64
   */
  static bool decodeFrameString(const std::string &encoded,
                                std::vector<uint8_t> &out);

  static std::string base64Encode(const std::vector<uint8_t> &data);
  static bool base64Decode(const std::string &text, std::vector<uint8_t> &out);
  static std::string percentEncode(const std::string &text);
  static bool percentDecode(const std::string &text, std::string &out);

  /// @brief Residue mod 256 of a signed protocol value
  static uint8_t fold(int value) { return static_cast<uint8_t>(value & 0xFF); }
};

} // namespace PetLink
