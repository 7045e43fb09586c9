/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - template-based multi-format config parser.
 */

#include "awp/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

namespace {

std::string WriteTempFile(const char* name, const char* content) {
  std::string path = std::string("/tmp/awp_test_") + name;
  FILE* f = std::fopen(path.c_str(), "w");
  REQUIRE(f != nullptr);
  (void)std::fputs(content, f);
  (void)std::fclose(f);
  return path;
}

}  // namespace

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef AWP_CONFIG_INI_ENABLED

using IniCfg = awp::Config<awp::IniBackend>;

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const char* ini_data =
      "[analysis_pool]\n"
      "default_size = 3\n"
      "name = analysis\n"
      "[log]\n"
      "level = INFO\n";

  IniCfg cfg;
  auto result = cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)),
                               awp::ConfigFormat::kIni);
  REQUIRE(result.has_value());

  REQUIRE(cfg.GetInt("analysis_pool", "default_size", 0) == 3);
  REQUIRE(std::strcmp(cfg.GetString("analysis_pool", "name"), "analysis") == 0);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "INFO") == 0);
  REQUIRE(cfg.HasSection("log"));
  REQUIRE(!cfg.HasSection("net"));
}

TEST_CASE("INI GetString default", "[config][ini]") {
  IniCfg cfg;
  REQUIRE(std::strcmp(cfg.GetString("x", "y", "default"), "default") == 0);
}

TEST_CASE("INI GetInt default", "[config][ini]") {
  IniCfg cfg;
  REQUIRE(cfg.GetInt("x", "y", 42) == 42);
}

TEST_CASE("INI GetBool", "[config][ini]") {
  const char* ini_data =
      "[flags]\n"
      "a = true\n"
      "b = yes\n"
      "c = 1\n"
      "d = on\n"
      "e = false\n"
      "f = off\n";

  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)),
                         awp::ConfigFormat::kIni).has_value());
  REQUIRE(cfg.GetBool("flags", "a"));
  REQUIRE(cfg.GetBool("flags", "b"));
  REQUIRE(cfg.GetBool("flags", "c"));
  REQUIRE(cfg.GetBool("flags", "d"));
  REQUIRE_FALSE(cfg.GetBool("flags", "e", true));
  REQUIRE_FALSE(cfg.GetBool("flags", "f", true));
  REQUIRE(cfg.GetBool("flags", "missing", true));
}

TEST_CASE("INI GetUint rejects negatives", "[config][ini]") {
  const char* ini_data =
      "[p]\n"
      "ok = 17\n"
      "neg = -4\n"
      "junk = abc\n";

  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)),
                         awp::ConfigFormat::kIni).has_value());
  REQUIRE(cfg.GetUint("p", "ok", 1U) == 17U);
  REQUIRE(cfg.GetUint("p", "neg", 1U) == 1U);
  REQUIRE(cfg.GetUint("p", "junk", 1U) == 1U);
  REQUIRE(!cfg.FindInt("p", "junk").has_value());
}

TEST_CASE("INI keys are case-insensitive", "[config][ini]") {
  const char* ini_data = "[Pool]\nQueue_Limit = 50\n";
  IniCfg cfg;
  REQUIRE(cfg.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)),
                         awp::ConfigFormat::kIni).has_value());
  REQUIRE(cfg.GetUint("pool", "queue_limit", 0U) == 50U);
}

TEST_CASE("INI LoadFile", "[config][ini]") {
  auto path = WriteTempFile("pool.ini", "[analysis_pool]\nmax_size = 6\n");
  IniCfg cfg;
  auto r = cfg.LoadFile(path.c_str());
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetUint("analysis_pool", "max_size", 0U) == 6U);
  (void)std::remove(path.c_str());
}

TEST_CASE("INI LoadFile missing file", "[config][ini]") {
  IniCfg cfg;
  auto r = cfg.LoadFile("/nonexistent/awp_pool.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == awp::ConfigError::kFileNotFound);
}

TEST_CASE("INI unsupported format requested", "[config][ini]") {
  IniCfg cfg;
  const char* data = "{}";
  auto r = cfg.LoadBuffer(data, 2U, awp::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == awp::ConfigError::kFormatNotSupported);
}

#endif  // AWP_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef AWP_CONFIG_JSON_ENABLED

using JsonCfg = awp::Config<awp::JsonBackend>;

TEST_CASE("JSON LoadBuffer sections and scalars", "[config][json]") {
  const char* json_data = R"({
    "analysis_pool": {
      "default_size": 4,
      "name": "wormhole",
      "autoscale": true,
      "ratio": 0.5
    },
    "version": 2
  })";

  JsonCfg cfg;
  auto r = cfg.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)),
                          awp::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetUint("analysis_pool", "default_size", 0U) == 4U);
  REQUIRE(std::strcmp(cfg.GetString("analysis_pool", "name"), "wormhole") == 0);
  REQUIRE(cfg.GetBool("analysis_pool", "autoscale"));
  REQUIRE(cfg.GetDouble("analysis_pool", "ratio", 0.0) == 0.5);
  REQUIRE(cfg.GetInt("", "version", 0) == 2);
}

TEST_CASE("JSON parse error", "[config][json]") {
  const char* bad = "{ \"a\": ";
  JsonCfg cfg;
  auto r = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)), awp::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == awp::ConfigError::kParseError);
}

TEST_CASE("JSON top-level array rejected", "[config][json]") {
  const char* arr = "[1, 2, 3]";
  JsonCfg cfg;
  auto r = cfg.LoadBuffer(arr, static_cast<uint32_t>(std::strlen(arr)), awp::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == awp::ConfigError::kParseError);
}

TEST_CASE("JSON LoadFile auto-detects by extension", "[config][json]") {
  auto path = WriteTempFile("pool.json", R"({"analysis_pool": {"queue_limit": 25}})");
  JsonCfg cfg;
  REQUIRE(cfg.LoadFile(path.c_str()).has_value());
  REQUIRE(cfg.GetUint("analysis_pool", "queue_limit", 0U) == 25U);
  (void)std::remove(path.c_str());
}

#endif  // AWP_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef AWP_CONFIG_YAML_ENABLED

using YamlCfg = awp::Config<awp::YamlBackend>;

TEST_CASE("YAML LoadBuffer sections", "[config][yaml]") {
  const char* yaml_data =
      "analysis_pool:\n"
      "  min_size: 2\n"
      "  cache_namespace: scores\n"
      "  enabled: true\n";

  YamlCfg cfg;
  auto r = cfg.LoadBuffer(yaml_data, static_cast<uint32_t>(std::strlen(yaml_data)),
                          awp::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetUint("analysis_pool", "min_size", 0U) == 2U);
  REQUIRE(std::strcmp(cfg.GetString("analysis_pool", "cache_namespace"), "scores") == 0);
  REQUIRE(cfg.GetBool("analysis_pool", "enabled"));
}

#endif  // AWP_CONFIG_YAML_ENABLED

// ============================================================================
// Multi-format
// ============================================================================

#if defined(AWP_CONFIG_INI_ENABLED) && defined(AWP_CONFIG_JSON_ENABLED)

TEST_CASE("MultiConfig picks backend from extension", "[config][multi]") {
  auto ini = WriteTempFile("multi.ini", "[a]\nk = 1\n");
  auto json = WriteTempFile("multi.json", R"({"a": {"k": 2}})");

  awp::MultiConfig from_ini;
  REQUIRE(from_ini.LoadFile(ini.c_str()).has_value());
  REQUIRE(from_ini.GetInt("a", "k", 0) == 1);

  awp::MultiConfig from_json;
  REQUIRE(from_json.LoadFile(json.c_str()).has_value());
  REQUIRE(from_json.GetInt("a", "k", 0) == 2);

  (void)std::remove(ini.c_str());
  (void)std::remove(json.c_str());
}

#endif
