/**
 * @file Frame.h
 * @brief CORE:Frame - W5 BLE frame builder and parser
 * @version 1.0.0
 *
 * Layout (all bytes mod 256):
 *   FA FC FD | opcode | 01 | seq | len_lo | len_hi | payload... | FB
 */
#pragma once
#include "Types.h"
#include <vector>

namespace PetLink {

#define PETLINK_FRAME_OVERHEAD 9

/**
 * @struct ParsedFrame
 * @brief Fields recovered from a wire frame
 */
struct ParsedFrame {
  uint8_t opcode = 0;
  uint8_t sequence = 0;
  std::vector<uint8_t> payload;
};

/**
 * @class Frame
 * @brief Pure frame assembly; the session owns the sequence counter
 */
class Frame {
public:
  /**
   * @brief Assemble a frame
   * @param opcode Signed opcode (e.g. -35)
   * @param sequence Session sequence value
   * @param payload Signed or unsigned values, folded mod 256
   * @return Wire bytes
   */
  static std::vector<uint8_t> build(int opcode, uint8_t sequence,
                                    const std::vector<int> &payload);

  /**
   * @brief Validate and split a wire frame
   * @param bytes Wire bytes
   * @param out Parsed fields
   * @return false if header, marker, length or terminator is wrong
   */
  static bool parse(const std::vector<uint8_t> &bytes, ParsedFrame &out);
};

} // namespace PetLink
