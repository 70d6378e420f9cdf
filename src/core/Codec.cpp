/**
 * @file Codec.cpp
 * @brief CORE:Codec - W5 command payloads and transport encoding
 */

#include "Codec.h"
#include <mbedtls/base64.h>

namespace PetLink {

static int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

static void appendShort(std::vector<int> &out, uint16_t value) {
  std::array<uint8_t, 2> bytes = Codec::encodeShort(value);
  out.push_back(bytes[0]);
  out.push_back(bytes[1]);
}

std::array<uint8_t, 2> Codec::encodeShort(uint16_t value) {
  std::array<uint8_t, 2> out;
  out[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
  out[1] = static_cast<uint8_t>(value & 0xFF);
  return out;
}

uint16_t Codec::decodeShort(uint8_t hi, uint8_t lo) {
  return static_cast<uint16_t>((static_cast<uint16_t>(hi) << 8) | lo);
}

int Codec::opcodeFor(FountainCommand cmd) {
  switch (cmd) {
  case FountainCommand::HANDSHAKE_FIRST:
    return PETLINK_OP_HANDSHAKE_FIRST;
  case FountainCommand::HANDSHAKE_SECOND:
    return PETLINK_OP_HANDSHAKE_SECOND;
  case FountainCommand::PAUSE:
  case FountainCommand::NORMAL:
  case FountainCommand::SMART:
  case FountainCommand::NORMAL_TO_PAUSE:
  case FountainCommand::SMART_TO_PAUSE:
    return PETLINK_OP_MODE;
  case FountainCommand::RESET_FILTER:
    return PETLINK_OP_RESET_FILTER;
  case FountainCommand::LIGHT_ON:
  case FountainCommand::LIGHT_OFF:
  case FountainCommand::LIGHT_LOW:
  case FountainCommand::LIGHT_MEDIUM:
  case FountainCommand::LIGHT_HIGH:
  case FountainCommand::DND_ON:
  case FountainCommand::DND_OFF:
    return PETLINK_OP_SETTINGS;
  }
  return 0;
}

uint8_t Codec::commandCode(FountainCommand cmd) {
  return fold(opcodeFor(cmd));
}

bool Codec::isSettingsCommand(FountainCommand cmd) {
  return opcodeFor(cmd) == PETLINK_OP_SETTINGS;
}

CodecStatus Codec::buildSettingsPayload(FountainCommand cmd,
                                        const FountainSettings *settings,
                                        std::vector<int> &out) {
  out.clear();
  if (settings == nullptr)
    return CodecStatus::MISSING_DEVICE_STATE;

  int lamp = settings->lampSwitch;
  int brightness = settings->brightness;
  int dnd = settings->dndSwitch;

  switch (cmd) {
  case FountainCommand::LIGHT_ON:
    lamp = 1;
    break;
  case FountainCommand::LIGHT_OFF:
    lamp = 0;
    break;
  case FountainCommand::LIGHT_LOW:
    brightness = 1;
    break;
  case FountainCommand::LIGHT_MEDIUM:
    brightness = 2;
    break;
  case FountainCommand::LIGHT_HIGH:
    brightness = 3;
    break;
  case FountainCommand::DND_ON:
    dnd = 1;
    break;
  case FountainCommand::DND_OFF:
    dnd = 0;
    break;
  case FountainCommand::PAUSE:
  case FountainCommand::NORMAL:
  case FountainCommand::SMART:
  case FountainCommand::NORMAL_TO_PAUSE:
  case FountainCommand::SMART_TO_PAUSE:
  case FountainCommand::RESET_FILTER:
  case FountainCommand::HANDSHAKE_FIRST:
  case FountainCommand::HANDSHAKE_SECOND:
    // Not a settings write; caller should use buildPayload
    return CodecStatus::UNRESOLVED_COMMAND;
  }

  out.reserve(13);
  out.push_back(settings->smartWorkingTime);
  out.push_back(settings->smartSleepTime);
  out.push_back(lamp);
  out.push_back(brightness);
  appendShort(out, settings->lightUpTime);
  appendShort(out, settings->lightOutTime);
  out.push_back(dnd);
  appendShort(out, settings->dndStart);
  appendShort(out, settings->dndEnd);
  return CodecStatus::OK;
}

CodecStatus Codec::buildPayload(FountainCommand cmd,
                                const FountainSettings *settings,
                                std::vector<int> &out) {
  out.clear();

  switch (cmd) {
  case FountainCommand::PAUSE:
    return CodecStatus::UNRESOLVED_COMMAND;
  case FountainCommand::HANDSHAKE_FIRST:
  case FountainCommand::HANDSHAKE_SECOND:
  case FountainCommand::RESET_FILTER:
    return CodecStatus::OK;
  // Mode payload is {power, mode}; both flags are fixed per transition
  case FountainCommand::NORMAL:
    out = {1, 1};
    return CodecStatus::OK;
  case FountainCommand::SMART:
    out = {1, 2};
    return CodecStatus::OK;
  case FountainCommand::NORMAL_TO_PAUSE:
    out = {0, 1};
    return CodecStatus::OK;
  case FountainCommand::SMART_TO_PAUSE:
    out = {0, 2};
    return CodecStatus::OK;
  case FountainCommand::LIGHT_ON:
  case FountainCommand::LIGHT_OFF:
  case FountainCommand::LIGHT_LOW:
  case FountainCommand::LIGHT_MEDIUM:
  case FountainCommand::LIGHT_HIGH:
  case FountainCommand::DND_ON:
  case FountainCommand::DND_OFF:
    return buildSettingsPayload(cmd, settings, out);
  }
  return CodecStatus::UNRESOLVED_COMMAND;
}

std::string Codec::base64Encode(const std::vector<uint8_t> &data) {
  // Room for the output plus the terminating NUL mbedTLS writes
  std::vector<unsigned char> buf(((data.size() + 2) / 3) * 4 + 1);
  size_t olen = 0;
  int rc = mbedtls_base64_encode(buf.data(), buf.size(), &olen, data.data(),
                                 data.size());
  if (rc != 0)
    return std::string();
  return std::string(reinterpret_cast<const char *>(buf.data()), olen);
}

bool Codec::base64Decode(const std::string &text, std::vector<uint8_t> &out) {
  out.clear();
  // mbedTLS tolerates line breaks and short final quads; frame strings have
  // neither
  if (text.size() % 4 != 0)
    return false;
  for (char c : text)
    if (c == ' ' || c == '\r' || c == '\n')
      return false;

  std::vector<unsigned char> buf((text.size() / 4) * 3 + 1);
  size_t olen = 0;
  int rc = mbedtls_base64_decode(
      buf.data(), buf.size(), &olen,
      reinterpret_cast<const unsigned char *>(text.data()), text.size());
  if (rc != 0)
    return false;

  out.assign(buf.begin(), buf.begin() + olen);
  return true;
}

std::string Codec::percentEncode(const std::string &text) {
  static const char HEX_DIGITS[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size() * 3);

  for (char ch : text) {
    unsigned char c = static_cast<unsigned char>(ch);
    bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                      (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                      c == '.' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(HEX_DIGITS[c >> 4]);
      out.push_back(HEX_DIGITS[c & 0x0F]);
    }
  }

  return out;
}

bool Codec::percentDecode(const std::string &text, std::string &out) {
  out.clear();
  out.reserve(text.size());

  for (size_t i = 0; i < text.size(); i++) {
    if (text[i] != '%') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 2 >= text.size())
      return false;
    int hi = hexValue(text[i + 1]);
    int lo = hexValue(text[i + 2]);
    if (hi < 0 || lo < 0)
      return false;
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }

  return true;
}

std::string Codec::encodeFrameString(const std::vector<uint8_t> &frame) {
  return percentEncode(base64Encode(frame));
}

bool Codec::decodeFrameString(const std::string &encoded,
                              std::vector<uint8_t> &out) {
  std::string b64;
  if (!percentDecode(encoded, b64))
    return false;
  return base64Decode(b64, out);
}

} // namespace PetLink
