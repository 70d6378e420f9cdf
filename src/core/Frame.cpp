/**
 * @file Frame.cpp
 * @brief CORE:Frame - W5 BLE frame builder and parser
 */

#include "Frame.h"
#include "Codec.h"

namespace PetLink {

static const int FRAME_HEADER[3] = {PETLINK_BLE_HEADER_0, PETLINK_BLE_HEADER_1,
                                    PETLINK_BLE_HEADER_2};

std::vector<uint8_t> Frame::build(int opcode, uint8_t sequence,
                                  const std::vector<int> &payload) {
  std::vector<uint8_t> out;
  out.reserve(PETLINK_FRAME_OVERHEAD + payload.size());

  for (int b : FRAME_HEADER) {
    out.push_back(Codec::fold(b));
  }
  out.push_back(Codec::fold(opcode));
  out.push_back(PETLINK_BLE_MARKER);
  out.push_back(sequence);

  size_t len = payload.size();
  out.push_back(static_cast<uint8_t>(len & 0xFF));
  out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));

  for (int value : payload) {
    out.push_back(Codec::fold(value));
  }

  out.push_back(Codec::fold(PETLINK_BLE_TERMINATOR));
  return out;
}

bool Frame::parse(const std::vector<uint8_t> &bytes, ParsedFrame &out) {
  if (bytes.size() < PETLINK_FRAME_OVERHEAD)
    return false;

  for (size_t i = 0; i < 3; i++) {
    if (bytes[i] != Codec::fold(FRAME_HEADER[i]))
      return false;
  }

  if (bytes[4] != PETLINK_BLE_MARKER)
    return false;

  size_t len = static_cast<size_t>(bytes[6]) |
               (static_cast<size_t>(bytes[7]) << 8);
  if (bytes.size() != PETLINK_FRAME_OVERHEAD + len)
    return false;

  if (bytes.back() != Codec::fold(PETLINK_BLE_TERMINATOR))
    return false;

  out.opcode = bytes[3];
  out.sequence = bytes[5];
  out.payload.assign(bytes.begin() + 8, bytes.begin() + 8 + len);
  return true;
}

} // namespace PetLink
