/**
 * @file analysis_pool.hpp
 * @brief AnalysisPool - bounded, self-healing worker pool for slow analysis jobs.
 *
 * Architecture:
 *
 *   Submit()/SubmitAsync()
 *          |  admission (pool mutex)
 *          v
 *   idle worker? --yes--> WorkerSlot[i].cv --> WorkerLoop --> work(cancel)
 *          | no                                     |
 *          v                                        | completion (pool mutex):
 *   JobQueue (high FIFO | normal/low FIFO)  <-------+ deliver once, pull next job
 *
 *   SupervisorLoop : enforces deadlines, replaces retired slots, joins exited threads
 *   TimerScheduler : periodic Autoscaler tick (grow one / retire one idle)
 *
 * All pool state (workers, queue, counters, job ids) is guarded by one
 * mutex and every decision (admission, completion, crash, timeout, scaling,
 * stats) is taken in one short critical section. Analysis work always runs
 * outside the lock.
 *
 * Failure model:
 * - `work` returning a WorkError, or throwing a std::exception, is an
 *   analysis failure (JobError::kWorkFailed); the worker keeps running.
 * - Anything else escaping `work` (std::bad_alloc, non-standard exception
 *   objects) kills the worker: the caller gets kWorkerDied, the slot is
 *   removed and exactly one idle replacement is started.
 * - A job exceeding its deadline gets kTimeout and its cancel token raised.
 *   A running thread cannot be interrupted, so its slot is retired and
 *   replaced like a crash; the old thread is joined once `work` returns and
 *   its result is discarded.
 *
 * Usage:
 *   awp::AnalysisPoolConfig cfg;
 *   cfg.default_size = 2U;
 *   awp::AnalysisPool<Score> pool(cfg, &cache);
 *   pool.Start();
 *   awp::JobSpec spec;
 *   spec.kind = "character";
 *   auto outcome = pool.Submit(spec, [](const awp::CancelToken&) {
 *     return awp::expected<Score, awp::WorkError>::success(Score{42});
 *   });
 *   pool.Shutdown();
 *
 * Submit(), Shutdown() and ScaleTo() must not be called from inside `work`.
 */

#ifndef AWP_ANALYSIS_POOL_HPP_
#define AWP_ANALYSIS_POOL_HPP_

#include "awp/autoscaler.hpp"
#include "awp/job.hpp"
#include "awp/job_queue.hpp"
#include "awp/log.hpp"
#include "awp/platform.hpp"
#include "awp/pool_config.hpp"
#include "awp/result_cache.hpp"
#include "awp/timer.hpp"
#include "awp/vocabulary.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cinttypes>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace awp {

// ============================================================================
// Introspection types
// ============================================================================

enum class WorkerStatus : uint8_t {
  kIdle = 0U,
  kBusy = 1U,
};

/// Point-in-time snapshot. Occupancy fields are derived from live state.
struct PoolStats {
  uint32_t pool_size{0U};    ///< Live workers.
  uint32_t target_size{0U};  ///< Desired workers.
  uint32_t idle{0U};
  uint32_t busy{0U};
  uint32_t queue_length{0U};
  uint64_t total_processed{0U};  ///< Jobs that reached an outcome (success or error).
  uint64_t jobs_dropped{0U};     ///< Async submissions dropped on a full queue.
  uint64_t jobs_rejected{0U};    ///< Sync submissions refused with kQueueFull.
  uint64_t jobs_timed_out{0U};
  uint64_t workers_crashed{0U};
  uint64_t workers_replaced{0U};  ///< Crash and timeout replacements started.
  uint64_t cache_hits{0U};
  double utilization{0.0};  ///< busy / pool_size.
};

struct WorkerInfo {
  uint32_t id;
  WorkerStatus status;
  uint64_t current_job_id;  ///< 0 when idle.
  uint64_t started_at_us;
};

// ============================================================================
// AnalysisPool
// ============================================================================

template <typename ResultT>
class AnalysisPool final {
 public:
  using JobType = Job<ResultT>;
  using JobPtr = std::shared_ptr<JobType>;
  using WorkFn = typename JobType::WorkFn;
  using Outcome = JobOutcome<ResultT>;
  using CacheType = ResultCache<ResultT>;

  /**
   * @param cache      Optional external result cache (not owned).
   * @param telemetry  Optional job event sink.
   */
  explicit AnalysisPool(const AnalysisPoolConfig& cfg, CacheType* cache = nullptr,
                        TelemetryReporter telemetry = {})
      : cfg_(cfg),
        autoscaler_(cfg.Policy()),
        cache_(cache),
        telemetry_(telemetry),
        queue_(cfg.queue_limit),
        timer_(1U) {}

  ~AnalysisPool() { Shutdown(); }

  AnalysisPool(const AnalysisPool&) = delete;
  AnalysisPool& operator=(const AnalysisPool&) = delete;
  AnalysisPool(AnalysisPool&&) = delete;
  AnalysisPool& operator=(AnalysisPool&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Validate the configuration, spawn default_size workers, start the
   *        supervisor and (if enabled) the autoscale timer.
   */
  expected<void, PoolError> Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (running_) {
        return expected<void, PoolError>::error(PoolError::kAlreadyRunning);
      }
      auto valid = ValidatePoolConfig(cfg_);
      if (!valid) {
        AWP_LOG_ERROR(kLogCat, "pool '%s': invalid configuration (min=%u max=%u default=%u)",
                      cfg_.name.c_str(), cfg_.min_size, cfg_.max_size, cfg_.default_size);
        return valid;
      }

      running_ = true;
      stopping_ = false;
      target_size_ = cfg_.default_size;
      try {
        supervisor_ = std::thread(&AnalysisPool::SupervisorLoop, this);
      } catch (const std::system_error& e) {
        AWP_LOG_ERROR(kLogCat, "pool '%s': cannot start supervisor: %s", cfg_.name.c_str(), e.what());
        running_ = false;
        return expected<void, PoolError>::error(PoolError::kSpawnFailed);
      }
      RefillLocked();
      AWP_LOG_INFO(kLogCat, "pool '%s' started with %u/%u workers (queue limit %u)",
                   cfg_.name.c_str(), LiveCountLocked(), target_size_, queue_.Limit());

      // Timer callbacks run without the timer lock held, so pool -> timer
      // is the only lock order.
      if (cfg_.autoscale_period_ms > 0U) {
        auto task = timer_.Add(cfg_.autoscale_period_ms, &AnalysisPool::OnAutoscaleTimer, this);
        if (!task) {
          AWP_LOG_WARN(kLogCat, "pool '%s': autoscale timer unavailable", cfg_.name.c_str());
        } else {
          autoscale_task_ = task.value();
          auto started = timer_.Start();
          if (!started && started.get_error() != TimerError::kAlreadyRunning) {
            AWP_LOG_WARN(kLogCat, "pool '%s': autoscale timer failed to start", cfg_.name.c_str());
          }
        }
      }
    }
    return expected<void, PoolError>::success();
  }

  /**
   * @brief Stop admitting, fail queued synchronous jobs with kNotRunning,
   *        cancel in-flight work and join every thread. Idempotent.
   *
   * Callers of in-flight jobs still receive the job's real outcome.
   */
  void Shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
    timer_.Stop();

    std::vector<JobPtr> orphans;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (autoscale_task_.has_value()) {
        (void)timer_.Remove(autoscale_task_.value());
        autoscale_task_.reset();
      }
      if (!running_) {
        return;
      }
      running_ = false;
      stopping_ = true;
      orphans = queue_.Drain();
      for (auto& w : workers_) {
        w->retiring = true;
        if (w->current_job) {
          w->current_job->cancel.Cancel();
        }
        w->cv.notify_one();
      }
      for (const auto& job : orphans) {
        Emit(JobEventType::kFailed, *job, 0U, 0U, JobError::kNotRunning);
        if (job->caller) {
          (void)job->caller->Deliver(Outcome::error(JobFailure::Engine(JobError::kNotRunning, "pool shut down")));
        }
      }
      supervisor_cv_.notify_all();
    }

    if (supervisor_.joinable()) {
      supervisor_.join();
    }

    // Workers finishing their last job may still move slots around; keep
    // collecting until nothing is left.
    while (true) {
      std::vector<std::unique_ptr<WorkerSlot>> slots;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& w : workers_) {
          slots.push_back(std::move(w));
        }
        workers_.clear();
        for (auto& w : retired_) {
          slots.push_back(std::move(w));
        }
        retired_.clear();
      }
      if (slots.empty()) {
        break;
      }
      for (auto& w : slots) {
        if (w->thread.joinable()) {
          w->thread.join();
        }
      }
    }

    AWP_LOG_INFO(kLogCat, "pool '%s' stopped (%zu queued jobs failed)", cfg_.name.c_str(), orphans.size());
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return running_;
  }

  const AnalysisPoolConfig& Config() const noexcept { return cfg_; }

  // ======================== Submission ========================

  /**
   * @brief Run @p work and wait for its outcome.
   *
   * A cache hit on spec.cache_key returns immediately without running
   * anything. A full queue yields kQueueFull without blocking. Otherwise
   * the caller blocks for at most deadline + submission_overhead_ms.
   */
  Outcome Submit(const JobSpec& spec, WorkFn work) {
    if (AWP_UNLIKELY(!IsRunning())) {
      return Outcome::error(JobFailure::Engine(JobError::kNotRunning, "pool not running"));
    }

    if (cache_ != nullptr && !spec.cache_key.empty()) {
      optional<ResultT> hit = cache_->Get(cfg_.cache_namespace.c_str(), spec.cache_key.c_str());
      if (hit.has_value()) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          ++cache_hits_;
        }
        AWP_LOG_DEBUG(kLogCat, "cache hit for %s:%s", spec.kind.c_str(), spec.subject_id.c_str());
        return Outcome::success(std::move(hit).value());
      }
    }

    auto caller = std::make_shared<ReplySlot<Outcome>>();
    JobPtr job = MakeJob(spec, std::move(work), caller);
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!running_) {
        return Outcome::error(JobFailure::Engine(JobError::kNotRunning, "pool not running"));
      }
      job->id = next_job_id_++;
      auto admitted = AdmitLocked(job);
      if (!admitted) {
        ++jobs_rejected_;
        Emit(JobEventType::kRejected, *job, 0U, 0U, JobError::kQueueFull);
        AWP_LOG_WARN(kLogCat, "queue full (%u), rejecting job %" PRIu64 " %s:%s", queue_.Size(),
                     job->id, job->kind.c_str(), job->subject_id.c_str());
        return Outcome::error(JobFailure::Engine(JobError::kQueueFull, "analysis queue full"));
      }
    }

    const auto wait = std::chrono::milliseconds(static_cast<uint64_t>(job->deadline_ms) +
                                                cfg_.submission_overhead_ms);
    optional<Outcome> reply = caller->WaitFor(wait);
    if (!reply.has_value()) {
      AWP_LOG_WARN(kLogCat, "no reply for job %" PRIu64 " %s:%s within %u ms", job->id,
                   job->kind.c_str(), job->subject_id.c_str(),
                   job->deadline_ms + cfg_.submission_overhead_ms);
      return Outcome::error(JobFailure::Engine(JobError::kTimeout, "no reply within deadline"));
    }
    return std::move(reply).value();
  }

  /**
   * @brief Fire-and-forget submission.
   *
   * @return The admitted job id. A full queue drops the job with a warning;
   *         the submission is still acknowledged.
   */
  expected<uint64_t, PoolError> SubmitAsync(const JobSpec& spec, WorkFn work) {
    JobPtr job = MakeJob(spec, std::move(work), nullptr);
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_) {
      return expected<uint64_t, PoolError>::error(PoolError::kNotRunning);
    }
    job->id = next_job_id_++;
    auto admitted = AdmitLocked(job);
    if (AWP_UNLIKELY(!admitted)) {
      ++jobs_dropped_;
      Emit(JobEventType::kDropped, *job, 0U, 0U, JobError::kQueueFull);
      AWP_LOG_WARN(kLogCat, "queue full (%u), dropping async job %" PRIu64 " %s:%s", queue_.Size(),
                   job->id, job->kind.c_str(), job->subject_id.c_str());
    }
    return expected<uint64_t, PoolError>::success(job->id);
  }

  // ======================== Administration ========================

  /**
   * @brief Resize to @p n workers, n in [min_size, max_size].
   *
   * Shrinking retires idle workers at once; busy workers above the target
   * retire when their current job finishes. Growing records the target even
   * if some spawns fail (kSpawnFailed); the supervisor keeps retrying.
   */
  expected<void, PoolError> ScaleTo(uint32_t n) {
    if (n < cfg_.min_size || n > cfg_.max_size) {
      AWP_LOG_WARN(kLogCat, "scale_to(%u) outside [%u, %u]", n, cfg_.min_size, cfg_.max_size);
      return expected<void, PoolError>::error(PoolError::kInvalidSize);
    }
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_) {
      return expected<void, PoolError>::error(PoolError::kNotRunning);
    }
    const uint32_t from = target_size_;
    target_size_ = n;
    while (LiveCountLocked() > target_size_) {
      WorkerSlot* idle = FindIdleLocked();
      if (idle == nullptr) {
        break;
      }
      RetireLocked(idle);
    }
    RefillLocked();
    AWP_LOG_INFO(kLogCat, "scaled pool '%s' from %u to %u workers", cfg_.name.c_str(), from, n);
    if (LiveCountLocked() < target_size_) {
      return expected<void, PoolError>::error(PoolError::kSpawnFailed);
    }
    return expected<void, PoolError>::success();
  }

  /**
   * @brief Discard every queued job. Their synchronous callers receive no
   *        reply and time out on their own.
   * @return Number of discarded jobs.
   */
  uint32_t ClearQueue() {
    std::lock_guard<std::mutex> lock(mtx_);
    const uint32_t n = queue_.Clear();
    AWP_LOG_WARN(kLogCat, "clearing analysis job queue (%u jobs discarded)", n);
    return n;
  }

  /**
   * @brief Run one autoscaler tick now (same path as the periodic timer).
   * @return The decision that was applied; kNone if nothing changed.
   */
  ScaleDecision AutoscaleNow() {
    std::lock_guard<std::mutex> lock(mtx_);
    ScaleDecision none;
    none.target_size = target_size_;
    if (!running_) {
      return none;
    }

    ScaleInput in;
    in.queued = queue_.Size();
    in.idle = IdleCountLocked();
    in.size = target_size_;
    const ScaleDecision d = autoscaler_.Evaluate(in);

    switch (d.action) {
      case ScaleAction::kGrow: {
        auto spawned = SpawnLocked();
        if (!spawned) {
          AWP_LOG_ERROR(kLogCat, "auto-scale up to %u failed, keeping %u workers", d.target_size,
                        target_size_);
          return none;
        }
        target_size_ = d.target_size;
        AssignNextLocked(spawned.value());
        AWP_LOG_INFO(kLogCat, "auto-scaled pool '%s' up to %u workers (queue: %u)", cfg_.name.c_str(),
                     target_size_, in.queued);
        return d;
      }
      case ScaleAction::kShrink: {
        WorkerSlot* idle = FindIdleLocked();
        if (idle == nullptr) {
          return none;
        }
        RetireLocked(idle);
        target_size_ = d.target_size;
        AWP_LOG_INFO(kLogCat, "auto-scaled pool '%s' down to %u workers (idle: %u)", cfg_.name.c_str(),
                     target_size_, in.idle);
        return d;
      }
      case ScaleAction::kNone:
        break;
    }
    return none;
  }

  // ======================== Introspection ========================

  PoolStats GetStats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    PoolStats s;
    s.pool_size = LiveCountLocked();
    s.target_size = target_size_;
    s.idle = IdleCountLocked();
    s.busy = s.pool_size - s.idle;
    s.queue_length = queue_.Size();
    s.total_processed = total_processed_;
    s.jobs_dropped = jobs_dropped_;
    s.jobs_rejected = jobs_rejected_;
    s.jobs_timed_out = jobs_timed_out_;
    s.workers_crashed = workers_crashed_;
    s.workers_replaced = workers_replaced_;
    s.cache_hits = cache_hits_;
    s.utilization = (s.pool_size > 0U) ? static_cast<double>(s.busy) / static_cast<double>(s.pool_size) : 0.0;
    return s;
  }

  std::vector<WorkerInfo> GetWorkers() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<WorkerInfo> out;
    out.reserve(workers_.size());
    for (const auto& w : workers_) {
      WorkerInfo info;
      info.id = w->id;
      info.status = w->status;
      info.current_job_id = w->current_job ? w->current_job->id : 0U;
      info.started_at_us = w->started_at_us;
      out.push_back(info);
    }
    return out;
  }

 private:
  static constexpr const char* kLogCat = "AnalysisPool";

  /// Upper bound on supervisor sleep; also the spawn retry interval.
  static constexpr uint64_t kSupervisorPeriodUs = 1000000U;

  struct WorkerSlot {
    uint32_t id{0U};
    WorkerStatus status{WorkerStatus::kIdle};
    JobPtr current_job;
    uint64_t started_at_us{0U};
    uint64_t job_started_at_us{0U};
    bool retiring{false};   ///< Exit once idle.
    bool abandoned{false};  ///< Timed out; discard the result and exit.
    bool completing{false};  ///< Result in hand, cache write in progress.
    bool exited{false};
    std::condition_variable cv;
    std::thread thread;
  };

  struct ExecResult {
    optional<Outcome> outcome;
    bool crashed{false};
    FixedString<kMaxFailureMessage> crash_reason;
    uint64_t duration_us{0U};
  };

  // ======================== Worker thread ========================

  void WorkerLoop(WorkerSlot* w) {
    std::unique_lock<std::mutex> lock(mtx_);
    while (true) {
      w->cv.wait(lock, [w] { return w->current_job != nullptr || w->retiring; });
      if (!w->current_job) {
        break;
      }
      JobPtr job = w->current_job;
      lock.unlock();

      AWP_LOG_DEBUG(kLogCat, "worker %u starting job %" PRIu64 " %s:%s (priority: %s)", w->id, job->id,
                    job->kind.c_str(), job->subject_id.c_str(), PriorityName(job->priority));
      ExecResult r = Execute(*job);

      lock.lock();
      if (w->abandoned) {
        AWP_LOG_DEBUG(kLogCat, "worker %u discarding late result of job %" PRIu64, w->id, job->id);
        break;
      }
      if (r.crashed) {
        OnCrashLocked(w, *job, r);
        break;
      }
      if (r.outcome.value().has_value() && cache_ != nullptr && !job->cache_key.empty()) {
        // Claimed: the supervisor no longer times this job out.
        w->completing = true;
        lock.unlock();
        StoreInCache(*job, r.outcome.value().value());
        lock.lock();
      }
      OnCompletedLocked(w, *job, r);
    }
    w->exited = true;
    supervisor_cv_.notify_all();
  }

  ExecResult Execute(JobType& job) {
    ExecResult r;
    const uint64_t start = SteadyNowUs();
    try {
      auto res = job.work(job.cancel);
      if (res.has_value()) {
        r.outcome.emplace(Outcome::success(std::move(res).value()));
      } else {
        r.outcome.emplace(Outcome::error(JobFailure::FromWork(res.get_error())));
      }
    } catch (const std::bad_alloc&) {
      r.crashed = true;
      r.crash_reason.assign(TruncateToCapacity, "out of memory");
    } catch (const std::exception& e) {
      JobFailure f = JobFailure::Engine(JobError::kWorkFailed, e.what());
      f.work_code = -1;
      r.outcome.emplace(Outcome::error(f));
    } catch (...) {
      r.crashed = true;
      r.crash_reason.assign(TruncateToCapacity, "unknown exception escaped work");
    }
    r.duration_us = SteadyNowUs() - start;
    return r;
  }

  void StoreInCache(const JobType& job, const ResultT& value) {
    if (cache_ == nullptr || job.cache_key.empty()) {
      return;
    }
    if (!cache_->Put(cfg_.cache_namespace.c_str(), job.cache_key.c_str(), value, cfg_.cache_ttl_ms)) {
      AWP_LOG_WARN(kLogCat, "cache write failed for job %" PRIu64 " key '%s'", job.id, job.cache_key.c_str());
    }
  }

  // ======================== Event handling (pool lock held) ========================

  void OnCompletedLocked(WorkerSlot* w, JobType& job, ExecResult& r) {
    const uint64_t wait_us = w->job_started_at_us - job.requested_at_us;
    w->status = WorkerStatus::kIdle;
    w->current_job.reset();
    w->completing = false;
    ++total_processed_;

    Outcome& outcome = r.outcome.value();
    if (outcome.has_value()) {
      Emit(JobEventType::kCompleted, job, r.duration_us, wait_us, JobError::kWorkFailed);
      AWP_LOG_DEBUG(kLogCat, "completed job %" PRIu64 " %s:%s in %" PRIu64 " us", job.id, job.kind.c_str(),
                    job.subject_id.c_str(), r.duration_us);
    } else {
      Emit(JobEventType::kFailed, job, r.duration_us, wait_us, outcome.get_error().code);
      AWP_LOG_WARN(kLogCat, "job %" PRIu64 " %s:%s failed after %" PRIu64 " us: %s", job.id, job.kind.c_str(),
                   job.subject_id.c_str(), r.duration_us, outcome.get_error().message.c_str());
    }
    if (job.caller) {
      (void)job.caller->Deliver(std::move(outcome));
    }

    if (w->retiring) {
      return;
    }
    if (LiveCountLocked() > target_size_) {
      RetireLocked(w);
      return;
    }
    AssignNextLocked(w);
  }

  void OnCrashLocked(WorkerSlot* w, JobType& job, const ExecResult& r) {
    const uint64_t wait_us = w->job_started_at_us - job.requested_at_us;
    AWP_LOG_ERROR(kLogCat, "worker %u died running job %" PRIu64 " %s:%s: %s", w->id, job.id,
                  job.kind.c_str(), job.subject_id.c_str(), r.crash_reason.c_str());
    ++workers_crashed_;
    ++total_processed_;
    Emit(JobEventType::kWorkerDied, job, r.duration_us, wait_us, JobError::kWorkerDied);
    if (job.caller) {
      (void)job.caller->Deliver(Outcome::error(JobFailure::Engine(JobError::kWorkerDied, r.crash_reason.c_str())));
    }
    w->current_job.reset();
    w->status = WorkerStatus::kIdle;
    DetachLocked(w);
    ReplaceLocked(w->id);
  }

  void OnTimeoutLocked(WorkerSlot* w, uint64_t now_us) {
    JobPtr job = w->current_job;
    job->cancel.Cancel();
    ++jobs_timed_out_;
    ++total_processed_;
    AWP_LOG_WARN(kLogCat, "job %" PRIu64 " %s:%s exceeded its %u ms deadline on worker %u", job->id,
                 job->kind.c_str(), job->subject_id.c_str(), job->deadline_ms, w->id);
    Emit(JobEventType::kTimedOut, *job, now_us - w->job_started_at_us, w->job_started_at_us - job->requested_at_us,
         JobError::kTimeout);
    if (job->caller) {
      (void)job->caller->Deliver(Outcome::error(JobFailure::Engine(JobError::kTimeout, "deadline exceeded")));
    }
    w->abandoned = true;
    w->current_job.reset();
    w->status = WorkerStatus::kIdle;
    DetachLocked(w);
    ReplaceLocked(w->id);
  }

  /** Start one idle replacement for a lost slot if the pool is below target. */
  void ReplaceLocked(uint32_t lost_id) {
    if (stopping_ || LiveCountLocked() >= target_size_) {
      return;
    }
    auto spawned = SpawnLocked();
    if (!spawned) {
      AWP_LOG_ERROR(kLogCat, "could not replace worker %u, running with %u/%u workers", lost_id,
                    LiveCountLocked(), target_size_);
      return;
    }
    ++workers_replaced_;
    AWP_LOG_INFO(kLogCat, "worker %u replaced by worker %u", lost_id, spawned.value()->id);
    AssignNextLocked(spawned.value());
  }

  // ======================== Admission / dispatch (pool lock held) ========================

  expected<void, JobError> AdmitLocked(const JobPtr& job) {
    WorkerSlot* idle = FindIdleLocked();
    if (idle != nullptr) {
      StartJobLocked(idle, job);
      return expected<void, JobError>::success();
    }
    return queue_.Enqueue(job, job->priority);
  }

  void AssignNextLocked(WorkerSlot* w) {
    optional<JobPtr> next = queue_.Dequeue();
    if (next.has_value()) {
      StartJobLocked(w, next.value());
    }
  }

  void StartJobLocked(WorkerSlot* w, const JobPtr& job) {
    AWP_ASSERT(w->status == WorkerStatus::kIdle && !w->current_job);
    w->status = WorkerStatus::kBusy;
    w->current_job = job;
    w->job_started_at_us = SteadyNowUs();
    w->cv.notify_one();
    supervisor_cv_.notify_all();
  }

  // ======================== Worker set management (pool lock held) ========================

  expected<WorkerSlot*, PoolError> SpawnLocked() {
    auto slot = std::make_unique<WorkerSlot>();
    slot->id = next_worker_id_++;
    slot->started_at_us = SteadyNowUs();
    WorkerSlot* raw = slot.get();
    try {
      slot->thread = std::thread(&AnalysisPool::WorkerLoop, this, raw);
    } catch (const std::system_error& e) {
      AWP_LOG_ERROR(kLogCat, "failed to spawn worker: %s", e.what());
      return expected<WorkerSlot*, PoolError>::error(PoolError::kSpawnFailed);
    }
    workers_.push_back(std::move(slot));
    return expected<WorkerSlot*, PoolError>::success(raw);
  }

  /** Spawn toward target_size_; stops at the first failure. */
  void RefillLocked() {
    while (!stopping_ && LiveCountLocked() < target_size_) {
      auto spawned = SpawnLocked();
      if (!spawned) {
        return;
      }
      AssignNextLocked(spawned.value());
    }
  }

  /** Ask @p w to exit once idle and drop it from the live set. */
  void RetireLocked(WorkerSlot* w) {
    w->retiring = true;
    w->cv.notify_one();
    DetachLocked(w);
    AWP_LOG_DEBUG(kLogCat, "retiring worker %u", w->id);
  }

  /** Move @p w from the live set to the join list. No-op if already gone. */
  void DetachLocked(WorkerSlot* w) {
    auto it = std::find_if(workers_.begin(), workers_.end(),
                           [w](const std::unique_ptr<WorkerSlot>& p) { return p.get() == w; });
    if (it == workers_.end()) {
      return;
    }
    retired_.push_back(std::move(*it));
    workers_.erase(it);
    supervisor_cv_.notify_all();
  }

  WorkerSlot* FindIdleLocked() const {
    for (const auto& w : workers_) {
      if (w->status == WorkerStatus::kIdle && !w->retiring) {
        return w.get();
      }
    }
    return nullptr;
  }

  uint32_t IdleCountLocked() const {
    uint32_t n = 0U;
    for (const auto& w : workers_) {
      if (w->status == WorkerStatus::kIdle) {
        ++n;
      }
    }
    return n;
  }

  uint32_t LiveCountLocked() const { return static_cast<uint32_t>(workers_.size()); }

  // ======================== Supervisor thread ========================

  /**
   * Sleeps until the nearest job deadline (at most kSupervisorPeriodUs),
   * then times out overdue jobs, refills missing workers and joins threads
   * that have exited.
   */
  void SupervisorLoop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
      const uint64_t now = SteadyNowUs();
      uint64_t next_wake = now + kSupervisorPeriodUs;

      std::vector<WorkerSlot*> overdue;
      for (const auto& w : workers_) {
        if (w->status != WorkerStatus::kBusy || !w->current_job || w->completing) {
          continue;
        }
        const uint64_t deadline = w->job_started_at_us + static_cast<uint64_t>(w->current_job->deadline_ms) * 1000U;
        if (now >= deadline) {
          overdue.push_back(w.get());
        } else if (deadline < next_wake) {
          next_wake = deadline;
        }
      }
      for (WorkerSlot* w : overdue) {
        OnTimeoutLocked(w, now);
      }

      RefillLocked();
      const bool reaped = ReapLocked(lock);
      if (stopping_) {
        break;
      }
      // The lock was released while joining; state may have moved on.
      if (!overdue.empty() || reaped) {
        continue;
      }
      const uint64_t after = SteadyNowUs();
      if (next_wake > after) {
        (void)supervisor_cv_.wait_for(lock, std::chrono::microseconds(next_wake - after));
      }
    }
  }

  /**
   * Join retired threads that have finished. Releases the lock while joining.
   * @return true if any thread was joined.
   */
  bool ReapLocked(std::unique_lock<std::mutex>& lock) {
    std::vector<std::unique_ptr<WorkerSlot>> done;
    for (auto it = retired_.begin(); it != retired_.end();) {
      if ((*it)->exited) {
        done.push_back(std::move(*it));
        it = retired_.erase(it);
      } else {
        ++it;
      }
    }
    if (done.empty()) {
      return false;
    }
    lock.unlock();
    for (auto& w : done) {
      if (w->thread.joinable()) {
        w->thread.join();
      }
    }
    lock.lock();
    return true;
  }

  static void OnAutoscaleTimer(void* ctx) {
    auto* self = static_cast<AnalysisPool*>(ctx);
    (void)self->AutoscaleNow();
  }

  // ======================== Helpers ========================

  JobPtr MakeJob(const JobSpec& spec, WorkFn work, typename JobType::Caller caller) const {
    auto job = std::make_shared<JobType>();
    job->kind = spec.kind;
    job->subject_id = spec.subject_id;
    job->work = std::move(work);
    job->priority = spec.priority;
    job->requested_at_us = SteadyNowUs();
    job->caller = std::move(caller);
    job->deadline_ms = (spec.deadline_ms > 0U) ? spec.deadline_ms : cfg_.default_deadline_ms;
    job->cache_key = spec.cache_key;
    return job;
  }

  void Emit(JobEventType type, const JobType& job, uint64_t duration_us, uint64_t wait_us, JobError error) const {
    JobEvent ev;
    ev.type = type;
    ev.job_id = job.id;
    ev.kind = job.kind.c_str();
    ev.subject_id = job.subject_id.c_str();
    ev.priority = job.priority;
    ev.duration_us = duration_us;
    ev.queue_wait_us = wait_us;
    ev.error = error;
    telemetry_.Emit(ev);
  }

  // ======================== Data members ========================

  const AnalysisPoolConfig cfg_;
  const Autoscaler autoscaler_;
  CacheType* const cache_;
  const TelemetryReporter telemetry_;

  std::mutex lifecycle_mtx_;  ///< Serializes Start() and Shutdown(); taken before mtx_.
  mutable std::mutex mtx_;
  std::condition_variable supervisor_cv_;
  std::vector<std::unique_ptr<WorkerSlot>> workers_;
  std::vector<std::unique_ptr<WorkerSlot>> retired_;
  JobQueue<JobPtr> queue_;
  uint32_t target_size_{0U};
  uint32_t next_worker_id_{1U};
  uint64_t next_job_id_{1U};
  bool running_{false};
  bool stopping_{false};

  uint64_t total_processed_{0U};
  uint64_t jobs_dropped_{0U};
  uint64_t jobs_rejected_{0U};
  uint64_t jobs_timed_out_{0U};
  uint64_t workers_crashed_{0U};
  uint64_t workers_replaced_{0U};
  uint64_t cache_hits_{0U};

  std::thread supervisor_;
  TimerScheduler timer_;
  optional<TimerTaskId> autoscale_task_;
};

}  // namespace awp

#endif  // AWP_ANALYSIS_POOL_HPP_
