/**
 * @file config.hpp
 * @brief Flat key-value configuration with compile-time selected file backends.
 *
 * Every supported format is flattened to "section + key = value":
 *   - IniBackend  : inih          (AWP_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (AWP_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (AWP_CONFIG_YAML_ENABLED)
 *
 * For JSON and YAML the top-level object keys are sections and nested
 * scalar members are keys; top-level scalars land in the "" section.
 *
 * Usage:
 * @code
 *   awp::MultiConfig cfg;
 *   if (cfg.LoadFile("pool.ini").has_value()) {
 *     uint32_t limit = cfg.GetUint("analysis_pool", "queue_limit", 100U);
 *   }
 * @endcode
 */

#ifndef AWP_CONFIG_HPP_
#define AWP_CONFIG_HPP_

#include "awp/platform.hpp"
#include "awp/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef AWP_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef AWP_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef AWP_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef AWP_CONFIG_MAX_FILE_SIZE
#define AWP_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace awp {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

inline bool CaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf") ||
           detail::CaseEqual(ext, "cfg");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key, const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  /** Negative or non-numeric values yield the default. */
  uint32_t GetUint(const char* section, const char* key, uint32_t default_val = 0U) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long long val = std::strtoll(e->value, &end, 10);
    if (end == e->value || val < 0 || val > static_cast<long long>(UINT32_MAX)) return default_val;
    return static_cast<uint32_t>(val);
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value, &end);
    return (end == e->value) ? default_val : val;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value) return {};
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    return optional<bool>(ParseBool(e->value));
  }

  bool HasSection(const char* section) const {
    AWP_ASSERT(section != nullptr);
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const { return FindEntry(section, key) != nullptr; }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  static constexpr uint32_t kMaxEntries = 128U;
  static constexpr uint32_t kMaxKeyLen = 63U;
  static constexpr uint32_t kMaxValueLen = 255U;

  struct Entry {
    FixedString<kMaxKeyLen> section;
    FixedString<kMaxKeyLen> key;
    char value[kMaxValueLen + 1U];
  };

  /** Later definitions of the same section/key override earlier ones. */
  bool Put(const char* section, const char* key, const char* value) {
    Entry* e = FindMutable(section, key);
    if (e == nullptr) {
      if (count_ >= kMaxEntries) return false;
      e = &entries_[count_++];
      e->section.assign(TruncateToCapacity, section);
      e->key.assign(TruncateToCapacity, key);
    }
    CopyValue(e->value, value);
    return true;
  }

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf, uint32_t buf_size) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    const size_t bytes = std::fread(buf, 1U, buf_size - 1U, f);
    const bool truncated = (bytes == buf_size - 1U) && (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  static void CopyValue(char* dst, const char* src) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    const size_t n = std::strlen(src);
    const size_t len = (n > kMaxValueLen) ? kMaxValueLen : n;
    std::memcpy(dst, src, len);
    dst[len] = '\0';
  }

 private:
  const Entry* FindEntry(const char* section, const char* key) const {
    AWP_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section.c_str(), section) &&
          detail::CaseEqual(entries_[i].key.c_str(), key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry* FindMutable(const char* section, const char* key) {
    return const_cast<Entry*>(static_cast<const ConfigStore*>(this)->FindEntry(section, key));
  }

  static bool ParseBool(const char* s) noexcept {
    return detail::CaseEqual(s, "true") || detail::CaseEqual(s, "1") ||
           detail::CaseEqual(s, "yes") || detail::CaseEqual(s, "on");
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0U;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backends compiled out report kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef AWP_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    const int rc = ini_parse(path, &OnEntry, &store);
    if (rc == -1) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (rc != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t) {
    if (ini_parse_string(data, &OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->Put(section != nullptr ? section : "", name != nullptr ? name : "", value) ? 1 : 0;
  }
};
#endif

#ifdef AWP_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[AWP_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.Put(it.key().c_str(), kit.key().c_str(), Scalar(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Put("", it.key().c_str(), Scalar(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    return n.dump();
  }
};
#endif

#ifdef AWP_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[AWP_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data, uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          const auto key = kit.key().get_value<std::string>();
          if (!store.Put(section.c_str(), key.c_str(), Scalar(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Put("", section.c_str(), Scalar(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

 public:
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    AWP_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      const char* ext = Extension(path);
      format = (ext != nullptr) ? Detect<Backends...>(ext) : Head::kFormat;
    }
    return ParseFileAs<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    AWP_ASSERT(data != nullptr);
    return ParseBufferAs<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  static ConfigFormat Detect(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return Detect<Rest...>(ext);
    } else {
      return Head::kFormat;
    }
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseFileAs(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) {
      return ParseFileAs<Rest...>(path, format);
    } else {
      return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    }
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> ParseBufferAs(const char* data, uint32_t size, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0) {
      return ParseBufferAs<Rest...>(data, size, format);
    } else {
      return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
    }
  }
};

// ============================================================================
// Aliases
// ============================================================================

#ifdef AWP_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef AWP_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef AWP_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

#if defined(AWP_CONFIG_INI_ENABLED) || defined(AWP_CONFIG_JSON_ENABLED) || \
    defined(AWP_CONFIG_YAML_ENABLED)
namespace detail {
template <typename... Ts>
struct BackendList {};

template <typename List, bool Enabled, typename T>
struct AppendIf;
template <typename... Ts, typename T>
struct AppendIf<BackendList<Ts...>, true, T> {
  using type = BackendList<Ts..., T>;
};
template <typename... Ts, typename T>
struct AppendIf<BackendList<Ts...>, false, T> {
  using type = BackendList<Ts...>;
};

template <typename List>
struct ConfigFromList;
template <typename... Ts>
struct ConfigFromList<BackendList<Ts...>> {
  using type = Config<Ts...>;
};

#ifdef AWP_CONFIG_INI_ENABLED
static constexpr bool kIniEnabled = true;
#else
static constexpr bool kIniEnabled = false;
#endif
#ifdef AWP_CONFIG_JSON_ENABLED
static constexpr bool kJsonEnabled = true;
#else
static constexpr bool kJsonEnabled = false;
#endif
#ifdef AWP_CONFIG_YAML_ENABLED
static constexpr bool kYamlEnabled = true;
#else
static constexpr bool kYamlEnabled = false;
#endif

using EnabledBackends = typename AppendIf<
    typename AppendIf<typename AppendIf<BackendList<>, kIniEnabled, IniBackend>::type,
                      kJsonEnabled, JsonBackend>::type,
    kYamlEnabled, YamlBackend>::type;
}  // namespace detail

/** Every backend enabled at build time; the first one is the fallback format. */
using MultiConfig = detail::ConfigFromList<detail::EnabledBackends>::type;
#endif

}  // namespace awp

#endif  // AWP_CONFIG_HPP_
