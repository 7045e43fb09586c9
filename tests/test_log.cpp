/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "awp/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>
#include <vector>

namespace {

struct Captured {
  awp::log::Level level;
  std::string category;
  std::string message;
};

void CaptureHook(awp::log::Level level, const char* category, const char* message, void* ctx) {
  auto* out = static_cast<std::vector<Captured>*>(ctx);
  out->push_back(Captured{level, category, message});
}

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
  // In debug builds default is kDebug, in release kInfo
#ifdef NDEBUG
  REQUIRE(awp::log::GetLevel() == awp::log::Level::kInfo);
#else
  REQUIRE(awp::log::GetLevel() == awp::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = awp::log::GetLevel();
  awp::log::SetLevel(awp::log::Level::kError);
  REQUIRE(awp::log::GetLevel() == awp::log::Level::kError);
  awp::log::SetLevel(prev);  // restore
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!awp::log::IsInitialized());
  awp::log::Init();
  REQUIRE(awp::log::IsInitialized());
  awp::log::Shutdown();
  REQUIRE(!awp::log::IsInitialized());
}

TEST_CASE("Log macros compile and run", "[log]") {
  awp::log::SetLevel(awp::log::Level::kDebug);
  AWP_LOG_DEBUG("Test", "debug %d", 1);
  AWP_LOG_INFO("Test", "info %s", "msg");
  AWP_LOG_WARN("Test", "warn");
  AWP_LOG_ERROR("Test", "error %d %d", 1, 2);
  // FATAL aborts
  REQUIRE(true);
}

TEST_CASE("Log hook receives formatted lines", "[log]") {
  std::vector<Captured> lines;
  awp::log::SetLevel(awp::log::Level::kDebug);
  awp::log::SetHook(&CaptureHook, &lines);

  AWP_LOG_WARN("Pool", "queue full (%u)", 100U);
  AWP_LOG_INFO("Pool", "scaled to %d", 4);

  awp::log::SetHook(nullptr);
  AWP_LOG_INFO("Pool", "not captured");

  REQUIRE(lines.size() == 2U);
  REQUIRE(lines[0].level == awp::log::Level::kWarn);
  REQUIRE(lines[0].category == "Pool");
  REQUIRE(lines[0].message == "queue full (100)");
  REQUIRE(lines[1].message == "scaled to 4");
}

TEST_CASE("Log runtime level filtering", "[log]") {
  std::vector<Captured> lines;
  awp::log::SetHook(&CaptureHook, &lines);
  awp::log::SetLevel(awp::log::Level::kWarn);

  AWP_LOG_DEBUG("Test", "dropped");
  AWP_LOG_INFO("Test", "dropped");
  AWP_LOG_ERROR("Test", "kept");

  awp::log::SetLevel(awp::log::Level::kOff);
  AWP_LOG_ERROR("Test", "dropped");

  awp::log::SetHook(nullptr);
  awp::log::SetLevel(awp::log::Level::kDebug);  // restore

  REQUIRE(lines.size() == 1U);
  REQUIRE(lines[0].level == awp::log::Level::kError);
  REQUIRE(lines[0].message == "kept");
}

TEST_CASE("Log long messages are truncated", "[log]") {
  std::vector<Captured> lines;
  awp::log::SetHook(&CaptureHook, &lines);
  std::string big(2000, 'a');
  AWP_LOG_INFO("Test", "%s", big.c_str());
  awp::log::SetHook(nullptr);

  REQUIRE(lines.size() == 1U);
  REQUIRE(lines[0].message.size() < big.size());
}
