// analysis_pool_demo.cpp -- AnalysisPool walkthrough.
//
// Demonstrates:
//   1. Loading pool options from a config file (optional argv[1])
//   2. Synchronous submissions and the result cache short-circuit
//   3. Priority dispatch under load
//   4. Crash isolation and worker replacement
//   5. Deadline enforcement with cooperative cancellation
//   6. Manual and automatic scaling, statistics
//
// Usage: analysis_pool_demo [pool.ini|pool.json|pool.yaml]

#include "awp/analysis_pool.hpp"
#include "awp/config.hpp"
#include "awp/log.hpp"
#include "awp/pool_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

struct ThreatScore {
  uint64_t character_id;
  double score;
};

using ScorePool = awp::AnalysisPool<ThreatScore>;
using ScoreResult = awp::expected<ThreatScore, awp::WorkError>;

// ============================================================================
// In-process cache
// ============================================================================

class DemoCache final : public awp::ResultCache<ThreatScore> {
 public:
  awp::optional<ThreatScore> Get(const char* ns, const char* key) override {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(std::string(ns) + ":" + key);
    if (it == entries_.end()) return {};
    return awp::optional<ThreatScore>(it->second);
  }

  bool Put(const char* ns, const char* key, const ThreatScore& value, uint32_t) override {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_[std::string(ns) + ":" + key] = value;
    return true;
  }

 private:
  std::mutex mtx_;
  std::map<std::string, ThreatScore> entries_;
};

// ============================================================================
// Helpers
// ============================================================================

static ScorePool::WorkFn Analyze(uint64_t character_id, uint32_t cost_ms) {
  return [character_id, cost_ms](const awp::CancelToken& cancel) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(cost_ms);
    while (std::chrono::steady_clock::now() < until) {
      if (cancel.IsCancelled()) {
        return ScoreResult::error(awp::WorkError::Make(-1, "cancelled"));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return ScoreResult::success(ThreatScore{character_id, static_cast<double>(character_id % 97U) / 10.0});
  };
}

static awp::JobSpec Spec(const char* kind, uint64_t subject, awp::JobPriority prio = awp::JobPriority::kNormal) {
  awp::JobSpec spec;
  spec.kind.assign(awp::TruncateToCapacity, kind);
  spec.subject_id.assign(awp::TruncateToCapacity, std::to_string(subject).c_str());
  spec.priority = prio;
  return spec;
}

static void PrintStats(const char* label, const ScorePool& pool) {
  const auto s = pool.GetStats();
  printf("  [%s] size=%u target=%u idle=%u busy=%u queue=%u processed=%llu util=%.2f\n", label,
         s.pool_size, s.target_size, s.idle, s.busy, s.queue_length,
         static_cast<unsigned long long>(s.total_processed), s.utilization);
  printf("  [%s] dropped=%llu rejected=%llu timed_out=%llu crashed=%llu replaced=%llu cache_hits=%llu\n",
         label, static_cast<unsigned long long>(s.jobs_dropped),
         static_cast<unsigned long long>(s.jobs_rejected),
         static_cast<unsigned long long>(s.jobs_timed_out),
         static_cast<unsigned long long>(s.workers_crashed),
         static_cast<unsigned long long>(s.workers_replaced),
         static_cast<unsigned long long>(s.cache_hits));
}

static void PrintOutcome(const char* label, const ScorePool::Outcome& r) {
  if (r.has_value()) {
    printf("  %-14s -> character %llu score %.1f\n", label,
           static_cast<unsigned long long>(r.value().character_id), r.value().score);
  } else {
    printf("  %-14s -> %s (%s)\n", label, awp::JobErrorName(r.get_error().code),
           r.get_error().message.c_str());
  }
}

// ============================================================================
// Config
// ============================================================================

static awp::AnalysisPoolConfig LoadConfig(int argc, char** argv) {
  awp::AnalysisPoolConfig cfg;
  cfg.default_size = 2U;
  cfg.max_size = 4U;
  cfg.queue_limit = 8U;
  cfg.autoscale_period_ms = 200U;
#if defined(AWP_CONFIG_INI_ENABLED) || defined(AWP_CONFIG_JSON_ENABLED) || \
    defined(AWP_CONFIG_YAML_ENABLED)
  if (argc > 1) {
    awp::MultiConfig file;
    auto r = file.LoadFile(argv[1]);
    if (r.has_value()) {
      cfg = awp::LoadPoolConfig(file, awp::kDefaultPoolSection, cfg);
      printf("Loaded pool options from %s\n", argv[1]);
    } else {
      printf("Could not load %s (error %u), using built-in options\n", argv[1],
             static_cast<unsigned>(r.get_error()));
    }
  }
#else
  (void)argc;
  (void)argv;
#endif
  return cfg;
}

// ============================================================================
// Demos
// ============================================================================

static void DemoSyncAndCache(ScorePool& pool) {
  printf("\n=== Demo 1: Sync submit and cache ===\n");
  awp::JobSpec spec = Spec("character", 95465499U);
  spec.cache_key = "character:95465499";

  auto t0 = std::chrono::steady_clock::now();
  PrintOutcome("first call", pool.Submit(spec, Analyze(95465499U, 50U)));
  auto t1 = std::chrono::steady_clock::now();
  PrintOutcome("cached call", pool.Submit(spec, Analyze(95465499U, 50U)));
  auto t2 = std::chrono::steady_clock::now();
  printf("  first=%lld ms, cached=%lld ms\n",
         static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()),
         static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count()));
}

static void DemoPriority(ScorePool& pool) {
  printf("\n=== Demo 2: Priority dispatch ===\n");
  static std::mutex order_mtx;
  static std::string order;
  order.clear();

  // Occupy every worker so later jobs queue
  const uint32_t size = pool.GetStats().pool_size;
  for (uint32_t i = 0U; i < size; ++i) {
    (void)pool.SubmitAsync(Spec("warmup", i), Analyze(i, 100U));
  }

  auto tagged = [](char tag) {
    return [tag](const awp::CancelToken&) {
      std::lock_guard<std::mutex> lock(order_mtx);
      order.push_back(tag);
      return ScoreResult::success(ThreatScore{0U, 0.0});
    };
  };
  (void)pool.SubmitAsync(Spec("low", 1U, awp::JobPriority::kLow), tagged('L'));
  (void)pool.SubmitAsync(Spec("normal", 2U), tagged('N'));
  (void)pool.SubmitAsync(Spec("high", 3U, awp::JobPriority::kHigh), tagged('H'));
  (void)pool.SubmitAsync(Spec("normal", 4U), tagged('n'));
  PrintStats("queued", pool);

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  std::lock_guard<std::mutex> lock(order_mtx);
  printf("  execution order: %s (submitted L N H n)\n", order.c_str());
}

static void DemoCrash(ScorePool& pool) {
  printf("\n=== Demo 3: Crash isolation ===\n");
  PrintOutcome("crashing job", pool.Submit(Spec("corp", 98000001U), [](const awp::CancelToken&) -> ScoreResult {
    throw 42;  // not a std::exception: the hosting worker dies
  }));
  PrintOutcome("raising job", pool.Submit(Spec("corp", 98000002U), [](const awp::CancelToken&) -> ScoreResult {
    throw std::runtime_error("malformed killmail");
  }));
  PrintOutcome("next job", pool.Submit(Spec("corp", 98000003U), Analyze(98000003U, 10U)));
  PrintStats("after crash", pool);
}

static void DemoTimeout(ScorePool& pool) {
  printf("\n=== Demo 4: Deadline ===\n");
  awp::JobSpec spec = Spec("alliance", 99000001U);
  spec.deadline_ms = 100U;
  PrintOutcome("slow job", pool.Submit(spec, Analyze(99000001U, 5000U)));
  PrintStats("after timeout", pool);
}

static void DemoScaling(ScorePool& pool) {
  printf("\n=== Demo 5: Scaling ===\n");
  auto bad = pool.ScaleTo(pool.Config().max_size + 1U);
  printf("  scale_to(%u): %s\n", pool.Config().max_size + 1U,
         bad.has_value() ? "ok" : "rejected (invalid size)");

  for (uint64_t i = 0U; i < 12U; ++i) {
    (void)pool.SubmitAsync(Spec("burst", i), Analyze(i, 150U));
  }
  PrintStats("burst", pool);
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  PrintStats("autoscaled", pool);

  std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  PrintStats("drained", pool);

  if (pool.ScaleTo(pool.Config().min_size).has_value()) {
    PrintStats("scaled down", pool);
  }
}

int main(int argc, char** argv) {
  awp::log::SetLevel(awp::log::Level::kInfo);

  const awp::AnalysisPoolConfig cfg = LoadConfig(argc, argv);
  DemoCache cache;
  ScorePool pool(cfg, &cache);

  auto started = pool.Start();
  if (!started.has_value()) {
    printf("pool failed to start (error %u)\n", static_cast<unsigned>(started.get_error()));
    return 1;
  }
  PrintStats("start", pool);

  DemoSyncAndCache(pool);
  DemoPriority(pool);
  DemoCrash(pool);
  DemoTimeout(pool);
  DemoScaling(pool);

  pool.Shutdown();
  printf("\nDone.\n");
  return 0;
}
