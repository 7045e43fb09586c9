/**
 * @file job.hpp
 * @brief Job description, outcomes, cancellation and caller rendezvous for
 *        the analysis pool.
 *
 * A Job is immutable once admitted. Its `work` is an opaque callable that
 * returns either a result or a WorkError; the pool never inspects either
 * beyond routing them to the caller and the result cache.
 */

#ifndef AWP_JOB_HPP_
#define AWP_JOB_HPP_

#include "awp/platform.hpp"
#include "awp/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace awp {

// ============================================================================
// Enumerations
// ============================================================================

/// Dispatch priority. kHigh jobs jump ahead of every queued normal/low job.
enum class JobPriority : uint8_t {
  kHigh = 0U,
  kNormal = 1U,
  kLow = 2U,
};

/// Why a job produced no result.
enum class JobError : uint8_t {
  kQueueFull = 0U,   ///< Rejected at admission (backpressure).
  kWorkerDied = 1U,  ///< Hosting worker terminated abnormally; not retried.
  kTimeout = 2U,     ///< Deadline elapsed before completion.
  kInvalidSize = 3U, ///< Resize request outside [min_size, max_size].
  kWorkFailed = 4U,  ///< The analysis itself ran and failed.
  kNotRunning = 5U,  ///< Pool stopped before the job could run.
};

/// Errors of pool-level (non-job) operations.
enum class PoolError : uint8_t {
  kInvalidSize = 0U,
  kInvalidConfig = 1U,
  kAlreadyRunning = 2U,
  kNotRunning = 3U,
  kSpawnFailed = 4U,
};

inline const char* PriorityName(JobPriority p) noexcept {
  switch (p) {
    case JobPriority::kHigh:
      return "high";
    case JobPriority::kNormal:
      return "normal";
    case JobPriority::kLow:
      return "low";
  }
  return "?";
}

inline const char* JobErrorName(JobError e) noexcept {
  switch (e) {
    case JobError::kQueueFull:
      return "queue_full";
    case JobError::kWorkerDied:
      return "worker_died";
    case JobError::kTimeout:
      return "timeout";
    case JobError::kInvalidSize:
      return "invalid_size";
    case JobError::kWorkFailed:
      return "work_failed";
    case JobError::kNotRunning:
      return "not_running";
  }
  return "?";
}

// ============================================================================
// Failure types
// ============================================================================

static constexpr uint32_t kMaxFailureMessage = 127U;
static constexpr uint32_t kMaxLabelLen = 47U;

/// Failure reported by an analysis callable.
struct WorkError {
  int32_t code{0};
  FixedString<kMaxFailureMessage> message;

  static WorkError Make(int32_t code, const char* message) {
    WorkError e;
    e.code = code;
    e.message.assign(TruncateToCapacity, message);
    return e;
  }
};

/**
 * @brief What a caller receives instead of a result.
 *
 * `code == kWorkFailed` carries the analysis' own WorkError code/message;
 * every other code is an engine-level failure.
 */
struct JobFailure {
  JobError code{JobError::kWorkFailed};
  int32_t work_code{0};
  FixedString<kMaxFailureMessage> message;

  static JobFailure Engine(JobError code, const char* message = "") {
    JobFailure f;
    f.code = code;
    f.message.assign(TruncateToCapacity, message);
    return f;
  }

  static JobFailure FromWork(const WorkError& err) {
    JobFailure f;
    f.code = JobError::kWorkFailed;
    f.work_code = err.code;
    f.message = err.message;
    return f;
  }

  bool IsEngineFailure() const noexcept { return code != JobError::kWorkFailed; }
};

template <typename ResultT>
using JobOutcome = expected<ResultT, JobFailure>;

// ============================================================================
// CancelToken
// ============================================================================

/**
 * @brief Cooperative cancellation flag handed to `work`.
 *
 * Raised when the job's deadline elapses or the pool shuts down. Long
 * analyses should poll IsCancelled() and return early.
 */
class CancelToken final {
 public:
  bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

 private:
  std::atomic<bool> cancelled_{false};
};

// ============================================================================
// ReplySlot
// ============================================================================

/**
 * @brief Exactly-once rendezvous between the dispatcher and one waiting
 *        synchronous caller.
 *
 * The first Deliver() wins; later deliveries are discarded. A caller that
 * stops waiting closes the slot, which makes any later Deliver() a no-op.
 */
template <typename T>
class ReplySlot final {
 public:
  /** @return true if this call delivered the value. */
  bool Deliver(T value) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
      return false;
    }
    value_.emplace(std::move(value));
    closed_ = true;
    cv_.notify_all();
    return true;
  }

  /** Wait up to @p timeout; on expiry the slot is closed and empty is returned. */
  template <typename Rep, typename Period>
  optional<T> WaitFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    (void)cv_.wait_for(lock, timeout, [this] { return value_.has_value(); });
    closed_ = true;
    if (!value_.has_value()) {
      return {};
    }
    optional<T> out(std::move(value_.value()));
    value_.reset();
    return out;
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  optional<T> value_;
  bool closed_{false};
};

// ============================================================================
// JobSpec / Job
// ============================================================================

/// Caller-supplied admission parameters.
struct JobSpec {
  FixedString<kMaxLabelLen> kind{"analysis"};
  FixedString<kMaxLabelLen> subject_id;
  JobPriority priority{JobPriority::kNormal};
  uint32_t deadline_ms{0U};  ///< 0 selects the pool default.
  std::string cache_key;     ///< Empty disables cache read/write.
};

/**
 * @brief One admitted unit of work. Immutable after admission except for
 *        the cancellation token.
 */
template <typename ResultT>
struct Job {
  using WorkFn = std::function<expected<ResultT, WorkError>(const CancelToken&)>;
  using Caller = std::shared_ptr<ReplySlot<JobOutcome<ResultT>>>;

  uint64_t id{0U};
  FixedString<kMaxLabelLen> kind;
  FixedString<kMaxLabelLen> subject_id;
  WorkFn work;
  JobPriority priority{JobPriority::kNormal};
  uint64_t requested_at_us{0U};
  Caller caller;  ///< nullptr for fire-and-forget submissions.
  uint32_t deadline_ms{0U};
  std::string cache_key;
  CancelToken cancel;
};

// ============================================================================
// Telemetry
// ============================================================================

enum class JobEventType : uint8_t {
  kCompleted = 0U,
  kFailed,
  kTimedOut,
  kWorkerDied,
  kDropped,
  kRejected,
};

/// Event emitted once per job outcome (and per drop / rejection).
struct JobEvent {
  JobEventType type;
  uint64_t job_id;
  const char* kind;
  const char* subject_id;
  JobPriority priority;
  uint64_t duration_us;    ///< Execution time; 0 when the job never ran.
  uint64_t queue_wait_us;  ///< Admission to start of execution.
  JobError error;          ///< Meaningful for every type except kCompleted.
};

using TelemetryFn = void (*)(const JobEvent& event, void* ctx);

/**
 * @brief Telemetry injection point. A null `fn` disables emission.
 *
 * Called from pool threads while the pool lock is held: the sink must be
 * quick and must not call back into the pool.
 */
struct TelemetryReporter {
  TelemetryFn fn{nullptr};
  void* ctx{nullptr};

  void Emit(const JobEvent& event) const {
    if (fn != nullptr) {
      fn(event, ctx);
    }
  }
};

}  // namespace awp

#endif  // AWP_JOB_HPP_
