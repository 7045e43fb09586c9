/**
 * @file test_pool_config.cpp
 * @brief Tests for pool_config.hpp
 */

#include "awp/pool_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>

TEST_CASE("AnalysisPoolConfig defaults", "[pool_config]") {
  awp::AnalysisPoolConfig cfg;
  REQUIRE(cfg.default_size == 3U);
  REQUIRE(cfg.min_size == 1U);
  REQUIRE(cfg.max_size == 8U);
  REQUIRE(cfg.queue_limit == 100U);
  REQUIRE(cfg.default_deadline_ms == 300000U);
  REQUIRE(cfg.submission_overhead_ms == 5000U);
  REQUIRE(cfg.scale_up_queue_threshold == 2U);
  REQUIRE(cfg.scale_down_idle_threshold == 2U);
  REQUIRE(cfg.autoscale_period_ms == 30000U);
  REQUIRE(cfg.cache_namespace == "analysis");
  REQUIRE(cfg.cache_ttl_ms == 0U);
  REQUIRE(awp::ValidatePoolConfig(cfg).has_value());
}

TEST_CASE("AnalysisPoolConfig policy mirrors bounds", "[pool_config]") {
  awp::AnalysisPoolConfig cfg;
  cfg.min_size = 2U;
  cfg.max_size = 6U;
  cfg.scale_up_queue_threshold = 4U;
  auto p = cfg.Policy();
  REQUIRE(p.min_size == 2U);
  REQUIRE(p.max_size == 6U);
  REQUIRE(p.scale_up_queue_threshold == 4U);
  REQUIRE(p.scale_down_idle_threshold == 2U);
}

TEST_CASE("ValidatePoolConfig rejects inconsistent bounds", "[pool_config]") {
  SECTION("min above max") {
    awp::AnalysisPoolConfig cfg;
    cfg.min_size = 5U;
    cfg.max_size = 4U;
    cfg.default_size = 4U;
    auto r = awp::ValidatePoolConfig(cfg);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == awp::PoolError::kInvalidConfig);
  }

  SECTION("default outside bounds") {
    awp::AnalysisPoolConfig cfg;
    cfg.default_size = 9U;
    REQUIRE_FALSE(awp::ValidatePoolConfig(cfg).has_value());
    cfg.default_size = 0U;
    REQUIRE_FALSE(awp::ValidatePoolConfig(cfg).has_value());
  }

  SECTION("zero min") {
    awp::AnalysisPoolConfig cfg;
    cfg.min_size = 0U;
    cfg.default_size = 0U;
    REQUIRE_FALSE(awp::ValidatePoolConfig(cfg).has_value());
  }

  SECTION("zero queue limit or deadline") {
    awp::AnalysisPoolConfig cfg;
    cfg.queue_limit = 0U;
    REQUIRE_FALSE(awp::ValidatePoolConfig(cfg).has_value());
    cfg.queue_limit = 1U;
    cfg.default_deadline_ms = 0U;
    REQUIRE_FALSE(awp::ValidatePoolConfig(cfg).has_value());
  }
}

#ifdef AWP_CONFIG_INI_ENABLED

TEST_CASE("LoadPoolConfig reads INI section", "[pool_config][ini]") {
  const char* ini =
      "[analysis_pool]\n"
      "name = killboard\n"
      "default_size = 2\n"
      "min_size = 1\n"
      "max_size = 4\n"
      "queue_limit = 3\n"
      "default_deadline_ms = 1500\n"
      "autoscale_period_ms = 0\n"
      "cache_namespace = kb\n"
      "cache_ttl_ms = 60000\n";

  awp::IniConfig store;
  REQUIRE(store.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)), awp::ConfigFormat::kIni).has_value());

  auto cfg = awp::LoadPoolConfig(store);
  REQUIRE(cfg.name == "killboard");
  REQUIRE(cfg.default_size == 2U);
  REQUIRE(cfg.max_size == 4U);
  REQUIRE(cfg.queue_limit == 3U);
  REQUIRE(cfg.default_deadline_ms == 1500U);
  REQUIRE(cfg.autoscale_period_ms == 0U);
  REQUIRE(cfg.cache_namespace == "kb");
  REQUIRE(cfg.cache_ttl_ms == 60000U);
  // absent keys keep defaults
  REQUIRE(cfg.submission_overhead_ms == 5000U);
  REQUIRE(cfg.scale_up_queue_threshold == 2U);
  REQUIRE(awp::ValidatePoolConfig(cfg).has_value());
}

TEST_CASE("LoadPoolConfig keeps base on malformed values", "[pool_config][ini]") {
  const char* ini =
      "[workers]\n"
      "queue_limit = -5\n"
      "max_size = lots\n";

  awp::IniConfig store;
  REQUIRE(store.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)), awp::ConfigFormat::kIni).has_value());

  awp::AnalysisPoolConfig base;
  base.queue_limit = 7U;
  auto cfg = awp::LoadPoolConfig(store, "workers", base);
  REQUIRE(cfg.queue_limit == 7U);
  REQUIRE(cfg.max_size == 8U);
}

#endif  // AWP_CONFIG_INI_ENABLED

#ifdef AWP_CONFIG_JSON_ENABLED

TEST_CASE("LoadPoolConfig reads JSON section", "[pool_config][json]") {
  const char* json = R"({"analysis_pool": {"min_size": 2, "max_size": 5, "default_size": 2}})";
  awp::JsonConfig store;
  REQUIRE(store.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)), awp::ConfigFormat::kJson).has_value());

  auto cfg = awp::LoadPoolConfig(store);
  REQUIRE(cfg.min_size == 2U);
  REQUIRE(cfg.max_size == 5U);
  REQUIRE(cfg.default_size == 2U);
  REQUIRE(cfg.name == "analysis");
}

#endif  // AWP_CONFIG_JSON_ENABLED
