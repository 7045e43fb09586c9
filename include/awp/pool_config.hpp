/**
 * @file pool_config.hpp
 * @brief AnalysisPool options, validation and loading from a ConfigStore.
 *
 * Recognized keys (section "analysis_pool" by default):
 *
 *   default_size, min_size, max_size, queue_limit, default_deadline_ms,
 *   submission_overhead_ms, scale_up_queue_threshold,
 *   scale_down_idle_threshold, autoscale_period_ms, cache_namespace,
 *   cache_ttl_ms, name
 */

#ifndef AWP_POOL_CONFIG_HPP_
#define AWP_POOL_CONFIG_HPP_

#include "awp/autoscaler.hpp"
#include "awp/config.hpp"
#include "awp/job.hpp"
#include "awp/vocabulary.hpp"

#include <cstdint>

namespace awp {

static constexpr const char* kDefaultPoolSection = "analysis_pool";

struct AnalysisPoolConfig {
  FixedString<31> name{"analysis"};
  uint32_t default_size{3U};
  uint32_t min_size{1U};
  uint32_t max_size{8U};
  uint32_t queue_limit{100U};
  uint32_t default_deadline_ms{5U * 60U * 1000U};
  uint32_t submission_overhead_ms{5000U};  ///< Extra wait a sync caller allows beyond the deadline.
  uint32_t scale_up_queue_threshold{2U};
  uint32_t scale_down_idle_threshold{2U};
  uint32_t autoscale_period_ms{30000U};    ///< 0 disables the periodic tick.
  FixedString<31> cache_namespace{"analysis"};
  uint32_t cache_ttl_ms{0U};               ///< 0 leaves the TTL to the cache.

  AutoscalePolicy Policy() const noexcept {
    AutoscalePolicy p;
    p.min_size = min_size;
    p.max_size = max_size;
    p.scale_up_queue_threshold = scale_up_queue_threshold;
    p.scale_down_idle_threshold = scale_down_idle_threshold;
    return p;
  }
};

inline expected<void, PoolError> ValidatePoolConfig(const AnalysisPoolConfig& cfg) noexcept {
  const bool ok = (cfg.min_size >= 1U) && (cfg.min_size <= cfg.max_size) &&
                  (cfg.default_size >= cfg.min_size) && (cfg.default_size <= cfg.max_size) &&
                  (cfg.queue_limit >= 1U) && (cfg.default_deadline_ms >= 1U);
  return ok ? expected<void, PoolError>::success()
            : expected<void, PoolError>::error(PoolError::kInvalidConfig);
}

/**
 * @brief Read pool options from @p store; absent or malformed keys keep the
 *        values already in @p base. The result is not validated.
 */
inline AnalysisPoolConfig LoadPoolConfig(const ConfigStore& store,
                                         const char* section = kDefaultPoolSection,
                                         const AnalysisPoolConfig& base = AnalysisPoolConfig{}) {
  AnalysisPoolConfig cfg = base;
  if (store.HasKey(section, "name")) {
    cfg.name.assign(TruncateToCapacity, store.GetString(section, "name"));
  }
  cfg.default_size = store.GetUint(section, "default_size", cfg.default_size);
  cfg.min_size = store.GetUint(section, "min_size", cfg.min_size);
  cfg.max_size = store.GetUint(section, "max_size", cfg.max_size);
  cfg.queue_limit = store.GetUint(section, "queue_limit", cfg.queue_limit);
  cfg.default_deadline_ms = store.GetUint(section, "default_deadline_ms", cfg.default_deadline_ms);
  cfg.submission_overhead_ms =
      store.GetUint(section, "submission_overhead_ms", cfg.submission_overhead_ms);
  cfg.scale_up_queue_threshold =
      store.GetUint(section, "scale_up_queue_threshold", cfg.scale_up_queue_threshold);
  cfg.scale_down_idle_threshold =
      store.GetUint(section, "scale_down_idle_threshold", cfg.scale_down_idle_threshold);
  cfg.autoscale_period_ms = store.GetUint(section, "autoscale_period_ms", cfg.autoscale_period_ms);
  if (store.HasKey(section, "cache_namespace")) {
    cfg.cache_namespace.assign(TruncateToCapacity, store.GetString(section, "cache_namespace"));
  }
  cfg.cache_ttl_ms = store.GetUint(section, "cache_ttl_ms", cfg.cache_ttl_ms);
  return cfg;
}

}  // namespace awp

#endif  // AWP_POOL_CONFIG_HPP_
