/**
 * @file job_queue.hpp
 * @brief Bounded, priority-aware waiting list for jobs that found no idle worker.
 *
 * Layout: [high FIFO sub-queue][normal + low FIFO]. A new high item goes
 * behind the already queued high items and ahead of everything else; all
 * other items append at the back. Within one priority class order is
 * strict FIFO.
 *
 * Not thread-safe: the owning pool serializes access.
 */

#ifndef AWP_JOB_QUEUE_HPP_
#define AWP_JOB_QUEUE_HPP_

#include "awp/job.hpp"
#include "awp/platform.hpp"
#include "awp/vocabulary.hpp"

#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

namespace awp {

template <typename T>
class JobQueue final {
 public:
  explicit JobQueue(uint32_t limit) noexcept : limit_(limit) {}

  /**
   * @brief Admit @p item, failing with kQueueFull when Size() >= Limit().
   *
   * The limit is checked at call time only; it is never applied
   * retroactively to items already queued.
   */
  expected<void, JobError> Enqueue(T item, JobPriority priority) {
    if (Size() >= limit_) {
      return expected<void, JobError>::error(JobError::kQueueFull);
    }
    if (priority == JobPriority::kHigh) {
      items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(high_count_),
                    Entry{std::move(item), priority});
      ++high_count_;
    } else {
      items_.push_back(Entry{std::move(item), priority});
    }
    return expected<void, JobError>::success();
  }

  /** @return The front item, or empty when the queue is empty. */
  optional<T> Dequeue() {
    if (items_.empty()) {
      return {};
    }
    Entry front = std::move(items_.front());
    items_.pop_front();
    if (front.priority == JobPriority::kHigh) {
      AWP_ASSERT(high_count_ > 0U);
      --high_count_;
    }
    return optional<T>(std::move(front.item));
  }

  /** @return Number of discarded items. */
  uint32_t Clear() noexcept {
    const uint32_t n = Size();
    items_.clear();
    high_count_ = 0U;
    return n;
  }

  /** Remove every item in dispatch order, handing them to the caller. */
  std::vector<T> Drain() {
    std::vector<T> out;
    out.reserve(items_.size());
    for (auto& e : items_) {
      out.push_back(std::move(e.item));
    }
    items_.clear();
    high_count_ = 0U;
    return out;
  }

  uint32_t CountOf(JobPriority priority) const noexcept {
    if (priority == JobPriority::kHigh) {
      return high_count_;
    }
    uint32_t n = 0U;
    for (const auto& e : items_) {
      if (e.priority == priority) {
        ++n;
      }
    }
    return n;
  }

  uint32_t Size() const noexcept { return static_cast<uint32_t>(items_.size()); }
  bool Empty() const noexcept { return items_.empty(); }
  uint32_t Limit() const noexcept { return limit_; }

 private:
  struct Entry {
    T item;
    JobPriority priority;
  };

  std::deque<Entry> items_;
  uint32_t high_count_{0U};
  const uint32_t limit_;
};

}  // namespace awp

#endif  // AWP_JOB_QUEUE_HPP_
