/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "mscale/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

struct Captured {
  mscale::log::Level level;
  std::string category;
  std::string message;
};

void CaptureSink(mscale::log::Level level, const char* category,
                 const char* /*file*/, int /*line*/, const char* message,
                 void* ctx) {
  static_cast<std::vector<Captured>*>(ctx)->push_back(
      Captured{level, category, message});
}

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(mscale::log::GetLevel() == mscale::log::Level::kInfo);
#else
  REQUIRE(mscale::log::GetLevel() == mscale::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = mscale::log::GetLevel();
  mscale::log::SetLevel(mscale::log::Level::kError);
  REQUIRE(mscale::log::GetLevel() == mscale::log::Level::kError);
  mscale::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!mscale::log::IsInitialized());
  mscale::log::Init();
  REQUIRE(mscale::log::IsInitialized());
  mscale::log::Shutdown();
  REQUIRE(!mscale::log::IsInitialized());
}

TEST_CASE("Log macros compile and run", "[log]") {
  auto prev = mscale::log::GetLevel();
  mscale::log::SetLevel(mscale::log::Level::kDebug);
  MSCALE_LOG_DEBUG("Test", "debug %d", 1);
  MSCALE_LOG_INFO("Test", "info %s", "msg");
  MSCALE_LOG_WARN("Test", "warn");
  MSCALE_LOG_ERROR("Test", "error %d %d", 1, 2);
  mscale::log::SetLevel(prev);
  REQUIRE(true);
}

TEST_CASE("Log sink receives formatted records", "[log][sink]") {
  std::vector<Captured> records;
  auto prev = mscale::log::GetLevel();
  mscale::log::SetLevel(mscale::log::Level::kInfo);
  mscale::log::SetSink(&CaptureSink, &records);

  MSCALE_LOG_DEBUG("Directory", "dropped %d", 0);
  MSCALE_LOG_WARN("Directory", "machineset %s/%s", "ns", "ms-a");

  mscale::log::SetSink(nullptr);
  mscale::log::SetLevel(prev);

  REQUIRE(records.size() == 1);
  REQUIRE(records[0].level == mscale::log::Level::kWarn);
  REQUIRE(records[0].category == "Directory");
  REQUIRE(records[0].message == "machineset ns/ms-a");
}

TEST_CASE("Log runtime level filtering", "[log]") {
  std::vector<Captured> records;
  auto prev = mscale::log::GetLevel();
  mscale::log::SetSink(&CaptureSink, &records);
  mscale::log::SetLevel(mscale::log::Level::kOff);
  MSCALE_LOG_DEBUG("Test", "should not appear");
  MSCALE_LOG_INFO("Test", "should not appear");
  MSCALE_LOG_ERROR("Test", "should not appear");
  mscale::log::SetSink(nullptr);
  mscale::log::SetLevel(prev);
  REQUIRE(records.empty());
}

TEST_CASE("Log long messages are truncated", "[log][sink]") {
  std::vector<Captured> records;
  auto prev = mscale::log::GetLevel();
  mscale::log::SetLevel(mscale::log::Level::kDebug);
  mscale::log::SetSink(&CaptureSink, &records);
  std::string big(2 * MSCALE_LOG_MAX_MESSAGE, 'x');
  MSCALE_LOG_INFO("Test", "%s", big.c_str());
  mscale::log::SetSink(nullptr);
  mscale::log::SetLevel(prev);
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].message.size() == MSCALE_LOG_MAX_MESSAGE - 1);
}

TEST_CASE("Log ParseLevel", "[log]") {
  mscale::log::Level lvl = mscale::log::Level::kDebug;
  REQUIRE(mscale::log::ParseLevel("WARN", lvl));
  REQUIRE(lvl == mscale::log::Level::kWarn);
  REQUIRE(mscale::log::ParseLevel("warning", lvl));
  REQUIRE(lvl == mscale::log::Level::kWarn);
  REQUIRE(mscale::log::ParseLevel("off", lvl));
  REQUIRE(lvl == mscale::log::Level::kOff);
  REQUIRE(mscale::log::ParseLevel("Error", lvl));
  REQUIRE(lvl == mscale::log::Level::kError);
  REQUIRE_FALSE(mscale::log::ParseLevel("errors", lvl));
  REQUIRE(mscale::log::ParseLevel("OFF", lvl));
  REQUIRE(lvl == mscale::log::Level::kOff);
  REQUIRE_FALSE(mscale::log::ParseLevel("verbose", lvl));
  REQUIRE(lvl == mscale::log::Level::kOff);
  REQUIRE_FALSE(mscale::log::ParseLevel(nullptr, lvl));
}
