/**
 * @file RelaySessionTest.cpp
 * @brief Connect/poll retries, frame sequencing and disconnect
 */

#include "Fakes.h"
#include "src/core/Codec.h"
#include "src/core/Frame.h"
#include "src/core/RelaySession.h"
#include <gtest/gtest.h>

using namespace PetLink;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

const DeviceId FOUNTAIN = 500;
const DeviceId RELAY = 1;

struct SentFrame {
  uint8_t commandCode;
  ParsedFrame frame;
};

class RelaySessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    link.bleId = FOUNTAIN;
    link.mac = "AA:BB:CC:DD:EE:FF";

    roster.hasRelay = true;
    RosterDevice relay;
    relay.id = RELAY;
    relay.typeCode = 14;
    relay.pim = PETLINK_PIM_ONLINE;
    roster.devices.push_back(relay);

    RelayCandidate candidate;
    candidate.id = RELAY;
    candidates.push_back(candidate);

    settings.lampSwitch = 1;
    settings.brightness = 2;

    ON_CALL(api, listRelayCandidates(_))
        .WillByDefault(
            DoAll(SetArgReferee<0>(candidates), Return(ApiStatus::OK)));
    ON_CALL(api, bleConnect(_, _))
        .WillByDefault(DoAll(SetArgReferee<1>(1), Return(ApiStatus::OK)));
    ON_CALL(api, blePoll(_, _))
        .WillByDefault(DoAll(SetArgReferee<1>(0), Return(ApiStatus::OK)));
    ON_CALL(api, bleCancel(_)).WillByDefault(Return(ApiStatus::OK));
    ON_CALL(api, bleControl(_, _, _))
        .WillByDefault(Invoke(this, &RelaySessionTest::recordFrame));
  }

  ApiStatus recordFrame(const RelayLink &l, uint8_t code,
                        const std::string &data) {
    EXPECT_EQ(l.typeCode, 14);
    std::vector<uint8_t> bytes;
    EXPECT_TRUE(Codec::decodeFrameString(data, bytes));
    SentFrame sent;
    sent.commandCode = code;
    EXPECT_TRUE(Frame::parse(bytes, sent.frame));
    frames.push_back(sent);
    return frameStatus;
  }

  NiceMock<MockCloudApi> api;
  FakeClock clock;
  RelayResolver resolver;
  RelayConfig config;
  RelayLink link;
  DeviceRoster roster;
  std::vector<RelayCandidate> candidates;
  FountainSettings settings;

  std::vector<SentFrame> frames;
  ApiStatus frameStatus = ApiStatus::OK;
};

} // namespace

TEST_F(RelaySessionTest, ResolveTakesTypeCodeFromRoster) {
  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;

  EXPECT_EQ(session.resolveRelay(roster, status), RelayDecision::AVAILABLE);
  EXPECT_EQ(status, ApiStatus::OK);
  EXPECT_EQ(session.link().typeCode, 14);
  EXPECT_EQ(session.state(), SessionState::RESOLVING_RELAY);
}

TEST_F(RelaySessionTest, ConfiguredTypeCodeOverridesCloud) {
  config.relayTypeCode = 99;
  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;

  session.resolveRelay(roster, status);
  EXPECT_EQ(session.link().typeCode, 99);
}

TEST_F(RelaySessionTest, RosterWithoutRelaySkipsListing) {
  roster.hasRelay = false;
  EXPECT_CALL(api, listRelayCandidates(_)).Times(0);

  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;
  EXPECT_EQ(session.resolveRelay(roster, status),
            RelayDecision::NO_RELAY_REPORTED);
  EXPECT_EQ(session.state(), SessionState::IDLE);
}

TEST_F(RelaySessionTest, ConnectGivesUpAfterFourAttempts) {
  EXPECT_CALL(api, bleConnect(_, _))
      .Times(4)
      .WillRepeatedly(DoAll(SetArgReferee<1>(0), Return(ApiStatus::OK)));
  EXPECT_CALL(api, blePoll(_, _)).Times(0);
  EXPECT_CALL(api, bleCancel(_)).Times(0);

  RelaySession session(api, clock, resolver, config, link);
  EXPECT_EQ(session.open(), SessionResult::LINK_FAILED);
  EXPECT_EQ(session.state(), SessionState::FAILED);
  EXPECT_EQ(session.connectAttempts(), 4);
  EXPECT_EQ(clock.delays, (std::vector<uint32_t>{3000, 3000, 3000}));
}

TEST_F(RelaySessionTest, PollGivesUpAfterFourAttempts) {
  EXPECT_CALL(api, bleConnect(_, _)).Times(1);
  EXPECT_CALL(api, blePoll(_, _))
      .Times(4)
      .WillRepeatedly(Return(ApiStatus::TIMEOUT));

  RelaySession session(api, clock, resolver, config, link);
  EXPECT_EQ(session.open(), SessionResult::LINK_FAILED);
  EXPECT_EQ(session.pollAttempts(), 4);
  EXPECT_FALSE(session.linkOpen());
  EXPECT_FALSE(resolver.record(FOUNTAIN).hasPolled);
}

TEST_F(RelaySessionTest, TransientFailureThenSuccess) {
  EXPECT_CALL(api, bleConnect(_, _))
      .WillOnce(Return(ApiStatus::BLUETOOTH_ERROR))
      .WillOnce(DoAll(SetArgReferee<1>(1), Return(ApiStatus::OK)));

  RelaySession session(api, clock, resolver, config, link);
  EXPECT_EQ(session.open(), SessionResult::OK);
  EXPECT_EQ(session.connectAttempts(), 2);
  EXPECT_TRUE(session.linkOpen());
  EXPECT_EQ(resolver.record(FOUNTAIN).lastSuccessfulPollMs, clock.now - 2000);
}

TEST_F(RelaySessionTest, UpstreamAuthIsNotRetried) {
  EXPECT_CALL(api, bleConnect(_, _))
      .Times(1)
      .WillOnce(Return(ApiStatus::AUTH_ERROR));

  RelaySession session(api, clock, resolver, config, link);
  EXPECT_EQ(session.open(), SessionResult::UPSTREAM_AUTH);
  EXPECT_TRUE(clock.delays.empty());
}

TEST_F(RelaySessionTest, CommandUsesSequenceZeroAndDisconnects) {
  EXPECT_CALL(api, bleCancel(_)).Times(1);

  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;
  ASSERT_EQ(session.resolveRelay(roster, status), RelayDecision::AVAILABLE);
  EXPECT_EQ(session.runCommand(FountainCommand::LIGHT_HIGH, &settings),
            SessionResult::OK);

  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].commandCode, 221);
  EXPECT_EQ(frames[0].frame.sequence, 0);
  EXPECT_EQ(frames[0].frame.payload[3], 3);

  EXPECT_EQ(session.sequence(), 0);
  EXPECT_EQ(session.state(), SessionState::IDLE);
  EXPECT_EQ(clock.delays, (std::vector<uint32_t>{2000, 2000}));
}

TEST_F(RelaySessionTest, SequenceAdvancesOncePerFrame) {
  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;
  session.resolveRelay(roster, status);
  ASSERT_EQ(session.open(), SessionResult::OK);

  EXPECT_EQ(session.handshake(), SessionResult::OK);
  EXPECT_EQ(session.sendCommand(FountainCommand::SMART, nullptr),
            SessionResult::OK);
  EXPECT_EQ(session.sequence(), 3);

  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[0].commandCode, 215);
  EXPECT_EQ(frames[1].commandCode, 216);
  EXPECT_EQ(frames[2].commandCode, 220);
  for (uint8_t i = 0; i < 3; i++)
    EXPECT_EQ(frames[i].frame.sequence, i);

  session.close();
  EXPECT_EQ(session.sequence(), 0);
}

TEST_F(RelaySessionTest, HandshakeAfterCommandsRestartsAtOne) {
  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;
  session.resolveRelay(roster, status);
  ASSERT_EQ(session.open(), SessionResult::OK);

  EXPECT_EQ(session.sendCommand(FountainCommand::NORMAL, nullptr),
            SessionResult::OK);
  EXPECT_EQ(session.sendCommand(FountainCommand::SMART, nullptr),
            SessionResult::OK);
  EXPECT_EQ(session.sendCommand(FountainCommand::RESET_FILTER, nullptr),
            SessionResult::OK);
  EXPECT_EQ(session.handshake(), SessionResult::OK);

  ASSERT_EQ(frames.size(), 5u);
  std::vector<uint8_t> sequences;
  for (const SentFrame &sent : frames)
    sequences.push_back(sent.frame.sequence);
  EXPECT_EQ(sequences, (std::vector<uint8_t>{0, 1, 2, 1, 2}));
  EXPECT_EQ(frames[3].commandCode, 215);
  EXPECT_EQ(frames[4].commandCode, 216);
  EXPECT_EQ(session.sequence(), 3);
}

TEST_F(RelaySessionTest, RefreshSwallowsHandshakeFailure) {
  frameStatus = ApiStatus::BLUETOOTH_ERROR;
  EXPECT_CALL(api, bleCancel(_)).Times(1);
  bool refetched = false;

  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;
  session.resolveRelay(roster, status);
  EXPECT_EQ(session.runRefresh([&]() { refetched = true; }),
            SessionResult::OK);

  EXPECT_TRUE(refetched);
  EXPECT_EQ(frames.size(), 1u);
  EXPECT_EQ(session.sequence(), 0);
}

TEST_F(RelaySessionTest, CommandSurfacesFrameFailure) {
  frameStatus = ApiStatus::BLUETOOTH_ERROR;
  EXPECT_CALL(api, bleCancel(_)).Times(1);

  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;
  session.resolveRelay(roster, status);
  EXPECT_EQ(session.runCommand(FountainCommand::RESET_FILTER, nullptr),
            SessionResult::FRAME_FAILED);
  EXPECT_EQ(session.sequence(), 0);
}

TEST_F(RelaySessionTest, DisconnectFailureIsOnlyLogged) {
  RecordingLog log;
  EXPECT_CALL(api, bleCancel(_)).WillOnce(Return(ApiStatus::SERVER_ERROR));

  RelaySession session(api, clock, resolver, config, link, &log);
  ApiStatus status;
  session.resolveRelay(roster, status);
  EXPECT_EQ(session.runCommand(FountainCommand::NORMAL, nullptr),
            SessionResult::OK);
  EXPECT_EQ(log.count(LogLevel::WARN), 1u);
}

TEST_F(RelaySessionTest, MissingSettingsNeverSendsFrame) {
  EXPECT_CALL(api, bleControl(_, _, _)).Times(0);
  EXPECT_CALL(api, bleCancel(_)).Times(1);

  RelaySession session(api, clock, resolver, config, link);
  ApiStatus status;
  session.resolveRelay(roster, status);
  EXPECT_EQ(session.runCommand(FountainCommand::DND_ON, nullptr),
            SessionResult::ENCODE_FAILED);
}

TEST_F(RelaySessionTest, CancelAfterConnectStillDisconnects) {
  CancelToken cancel(false);
  EXPECT_CALL(api, bleConnect(_, _))
      .WillOnce(Invoke([&](const RelayLink &, int &state) {
        state = 1;
        cancel = true;
        return ApiStatus::OK;
      }));
  EXPECT_CALL(api, blePoll(_, _)).Times(0);
  EXPECT_CALL(api, bleCancel(_)).Times(1);

  RelaySession session(api, clock, resolver, config, link, nullptr, &cancel);
  ApiStatus status;
  session.resolveRelay(roster, status);
  EXPECT_EQ(session.runCommand(FountainCommand::NORMAL, nullptr),
            SessionResult::CANCELLED);
  EXPECT_EQ(session.state(), SessionState::IDLE);
}

TEST_F(RelaySessionTest, DestructorClosesOpenLink) {
  EXPECT_CALL(api, bleCancel(_)).Times(1);
  {
    RelaySession session(api, clock, resolver, config, link);
    ApiStatus status;
    session.resolveRelay(roster, status);
    ASSERT_EQ(session.open(), SessionResult::OK);
  }
}
