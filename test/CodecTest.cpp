/**
 * @file CodecTest.cpp
 * @brief Command payloads and transport encoding
 */

#include "src/core/Codec.h"
#include "src/core/Frame.h"
#include <cctype>
#include <gtest/gtest.h>

using namespace PetLink;

namespace {

FountainSettings sampleSettings() {
  FountainSettings s;
  s.smartWorkingTime = 10;
  s.smartSleepTime = 20;
  s.lampSwitch = 1;
  s.brightness = 1;
  s.lightUpTime = 0x0500;
  s.lightOutTime = 0x0A00;
  s.dndSwitch = 0;
  s.dndStart = 0;
  s.dndEnd = 0;
  return s;
}

} // namespace

TEST(CodecTest, ShortIsBigEndianAndReversible) {
  std::array<uint8_t, 2> bytes = Codec::encodeShort(0x1234);
  EXPECT_EQ(bytes[0], 0x12);
  EXPECT_EQ(bytes[1], 0x34);

  for (uint32_t v = 0; v <= 0xFFFF; v++) {
    std::array<uint8_t, 2> encoded = Codec::encodeShort(static_cast<uint16_t>(v));
    ASSERT_EQ(Codec::decodeShort(encoded[0], encoded[1]), v);
  }
}

TEST(CodecTest, BrightnessMediumEchoesEverythingElse) {
  FountainSettings s = sampleSettings();
  std::vector<int> payload;

  ASSERT_EQ(Codec::buildPayload(FountainCommand::LIGHT_MEDIUM, &s, payload),
            CodecStatus::OK);
  EXPECT_EQ(payload,
            (std::vector<int>{10, 20, 1, 2, 5, 0, 10, 0, 0, 0, 0, 0, 0}));
}

TEST(CodecTest, SettingsCommandsReplaceOneField) {
  FountainSettings s = sampleSettings();
  s.dndStart = 1320;
  s.dndEnd = 480;
  std::vector<int> payload;

  ASSERT_EQ(Codec::buildPayload(FountainCommand::LIGHT_OFF, &s, payload),
            CodecStatus::OK);
  EXPECT_EQ(payload[2], 0);
  EXPECT_EQ(payload[3], 1);

  ASSERT_EQ(Codec::buildPayload(FountainCommand::DND_ON, &s, payload),
            CodecStatus::OK);
  ASSERT_EQ(payload.size(), 13u);
  EXPECT_EQ(payload[8], 1);
  EXPECT_EQ(payload[9], 1320 >> 8);
  EXPECT_EQ(payload[10], 1320 & 0xFF);
  EXPECT_EQ(payload[11], 480 >> 8);
  EXPECT_EQ(payload[12], 480 & 0xFF);

  ASSERT_EQ(Codec::buildPayload(FountainCommand::LIGHT_HIGH, &s, payload),
            CodecStatus::OK);
  EXPECT_EQ(payload[3], 3);
}

TEST(CodecTest, SettingsCommandWithoutSnapshotFails) {
  std::vector<int> payload;
  EXPECT_EQ(Codec::buildPayload(FountainCommand::LIGHT_ON, nullptr, payload),
            CodecStatus::MISSING_DEVICE_STATE);
  EXPECT_TRUE(payload.empty());
}

TEST(CodecTest, ModePayloadsAreFixed) {
  std::vector<int> payload;
  ASSERT_EQ(Codec::buildPayload(FountainCommand::NORMAL, nullptr, payload),
            CodecStatus::OK);
  EXPECT_EQ(payload, (std::vector<int>{1, 1}));
  ASSERT_EQ(Codec::buildPayload(FountainCommand::SMART, nullptr, payload),
            CodecStatus::OK);
  EXPECT_EQ(payload, (std::vector<int>{1, 2}));
  ASSERT_EQ(
      Codec::buildPayload(FountainCommand::NORMAL_TO_PAUSE, nullptr, payload),
      CodecStatus::OK);
  EXPECT_EQ(payload, (std::vector<int>{0, 1}));
  ASSERT_EQ(
      Codec::buildPayload(FountainCommand::SMART_TO_PAUSE, nullptr, payload),
      CodecStatus::OK);
  EXPECT_EQ(payload, (std::vector<int>{0, 2}));

  EXPECT_EQ(Codec::buildPayload(FountainCommand::PAUSE, nullptr, payload),
            CodecStatus::UNRESOLVED_COMMAND);
}

TEST(CodecTest, ModeFrameCarriesSequenceAndLength) {
  std::vector<int> payload;
  ASSERT_EQ(Codec::buildPayload(FountainCommand::SMART, nullptr, payload),
            CodecStatus::OK);
  std::vector<uint8_t> frame =
      Frame::build(Codec::opcodeFor(FountainCommand::SMART), 7, payload);

  // [1, seq, 2, 0, power, mode] after the opcode
  std::vector<uint8_t> region(frame.begin() + 4, frame.begin() + 10);
  EXPECT_EQ(region, (std::vector<uint8_t>{1, 7, 2, 0, 1, 2}));
}

TEST(CodecTest, CommandCodesAreOpcodeResidues) {
  EXPECT_EQ(Codec::commandCode(FountainCommand::HANDSHAKE_FIRST), 215);
  EXPECT_EQ(Codec::commandCode(FountainCommand::HANDSHAKE_SECOND), 216);
  EXPECT_EQ(Codec::commandCode(FountainCommand::SMART_TO_PAUSE), 220);
  EXPECT_EQ(Codec::commandCode(FountainCommand::DND_OFF), 221);
  EXPECT_EQ(Codec::commandCode(FountainCommand::RESET_FILTER), 222);
  EXPECT_TRUE(Codec::isSettingsCommand(FountainCommand::LIGHT_LOW));
  EXPECT_FALSE(Codec::isSettingsCommand(FountainCommand::NORMAL));
}

TEST(CodecTest, Base64MatchesStandardAlphabet) {
  EXPECT_EQ(Codec::base64Encode({}), "");
  EXPECT_EQ(Codec::base64Encode({'f'}), "Zg==");
  EXPECT_EQ(Codec::base64Encode({'f', 'o'}), "Zm8=");
  EXPECT_EQ(Codec::base64Encode({'f', 'o', 'o'}), "Zm9v");
  EXPECT_EQ(Codec::base64Encode({0xFB, 0xFF}), "+/8=");
}

TEST(CodecTest, FrameStringEscapesBase64Specials) {
  std::vector<uint8_t> frame = {0xFA, 0xFC, 0xFD, 0xD7, 0x01,
                                0x00, 0x00, 0x00, 0xFB};
  std::string encoded = Codec::encodeFrameString(frame);

  EXPECT_EQ(encoded, "%2Bvz91wEAAAD7");
  for (char c : encoded)
    EXPECT_TRUE(isalnum(static_cast<unsigned char>(c)) || c == '%' ||
                c == '-' || c == '_' || c == '.' || c == '~');

  std::vector<uint8_t> decoded;
  ASSERT_TRUE(Codec::decodeFrameString(encoded, decoded));
  EXPECT_EQ(decoded, frame);
}

TEST(CodecTest, FrameStringRoundTripsEveryByteValue) {
  std::vector<uint8_t> bytes;
  for (int i = 0; i < 256; i++)
    bytes.push_back(static_cast<uint8_t>(i));

  for (size_t len = 0; len <= 4; len++) {
    std::vector<uint8_t> slice(bytes.begin(), bytes.begin() + 250 + len);
    std::vector<uint8_t> decoded;
    ASSERT_TRUE(
        Codec::decodeFrameString(Codec::encodeFrameString(slice), decoded));
    EXPECT_EQ(decoded, slice);
  }
}

TEST(CodecTest, DecodeRejectsMalformedInput) {
  std::vector<uint8_t> out;
  EXPECT_FALSE(Codec::decodeFrameString("%2", out));
  EXPECT_FALSE(Codec::decodeFrameString("%ZZAAAA", out));
  EXPECT_FALSE(Codec::decodeFrameString("Zg=", out));
  EXPECT_FALSE(Codec::decodeFrameString("Zg%3D%3DZm9v", out));
  EXPECT_FALSE(Codec::decodeFrameString("Z!==", out));
}
