/**
 * @file Fakes.h
 * @brief Test doubles for the PetLink interfaces
 */
#pragma once
#include "src/interfaces/Clock.h"
#include "src/interfaces/CloudApi.h"
#include "src/interfaces/Log.h"
#include "src/interfaces/Storage.h"
#include <gmock/gmock.h>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace PetLink {

class MockCloudApi : public CloudApi {
public:
  MOCK_METHOD(ApiStatus, fetchRoster, (DeviceRoster &), (override));
  MOCK_METHOD(ApiStatus, listRelayCandidates, (std::vector<RelayCandidate> &),
              (override));
  MOCK_METHOD(ApiStatus, fetchFountain, (DeviceId, FountainState &),
              (override));
  MOCK_METHOD(ApiStatus, bleConnect, (const RelayLink &, int &), (override));
  MOCK_METHOD(ApiStatus, blePoll, (const RelayLink &, int &), (override));
  MOCK_METHOD(ApiStatus, bleCancel, (const RelayLink &), (override));
  MOCK_METHOD(ApiStatus, bleControl,
              (const RelayLink &, uint8_t, const std::string &), (override));
  MOCK_METHOD(ApiStatus, fetchLitterBox,
              (DeviceId, LitterBoxModel, LitterBoxState &), (override));
  MOCK_METHOD(ApiStatus, controlLitterBox,
              (DeviceId, LitterBoxModel, const LitterBoxAction &), (override));
  MOCK_METHOD(ApiStatus, fetchLatestLitterEvent,
              (DeviceId, LitterBoxModel, LitterEvent &), (override));
};

/// Virtual time; delays advance the clock instead of sleeping
class FakeClock : public Clock {
public:
  uint64_t nowMs() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return now;
  }
  void delayMs(uint32_t ms) override {
    std::lock_guard<std::mutex> lock(mutex_);
    delays.push_back(ms);
    now += ms;
  }

  uint64_t now = 1000000;
  std::vector<uint32_t> delays;

private:
  mutable std::mutex mutex_;
};

class RecordingLog : public Log {
public:
  struct Line {
    LogLevel level;
    std::string tag;
    std::string message;
  };

  void write(LogLevel level, const char *tag, const char *message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    lines.push_back({level, tag, message});
  }

  size_t count(LogLevel level) const {
    size_t n = 0;
    for (const Line &line : lines)
      if (line.level == level)
        n++;
    return n;
  }

  std::vector<Line> lines;

private:
  std::mutex mutex_;
};

class MemoryStorage : public Storage {
public:
  bool begin() override {
    begun = true;
    return openOk;
  }
  bool writeU32(const char *key, uint32_t value) override {
    values[key] = value;
    return true;
  }
  bool readU32(const char *key, uint32_t &out) override {
    auto it = values.find(key);
    if (it == values.end())
      return false;
    out = it->second;
    return true;
  }
  bool erase(const char *key) override {
    values.erase(key);
    return true;
  }
  bool commit() override {
    commits++;
    return true;
  }

  bool openOk = true;
  bool begun = false;
  int commits = 0;
  std::map<std::string, uint32_t> values;
};

} // namespace PetLink
