/**
 * @file test_job_queue.cpp
 * @brief Tests for job_queue.hpp
 */

#include "awp/job_queue.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using awp::JobPriority;

namespace {

std::vector<int> DrainOrder(awp::JobQueue<int>& q) {
  std::vector<int> out;
  while (true) {
    auto v = q.Dequeue();
    if (!v.has_value()) {
      break;
    }
    out.push_back(v.value());
  }
  return out;
}

}  // namespace

TEST_CASE("JobQueue empty dequeue", "[job_queue]") {
  awp::JobQueue<int> q(4U);
  REQUIRE(q.Empty());
  REQUIRE(q.Size() == 0U);
  REQUIRE(q.Limit() == 4U);
  REQUIRE_FALSE(q.Dequeue().has_value());
}

TEST_CASE("JobQueue FIFO within one priority", "[job_queue]") {
  awp::JobQueue<int> q(10U);
  for (int i = 1; i <= 5; ++i) {
    REQUIRE(q.Enqueue(i, JobPriority::kNormal).has_value());
  }
  REQUIRE(DrainOrder(q) == std::vector<int>{1, 2, 3, 4, 5});
}

TEST_CASE("JobQueue high jumps ahead of normal and low", "[job_queue]") {
  awp::JobQueue<int> q(10U);
  // low, normal, high, normal
  REQUIRE(q.Enqueue(1, JobPriority::kLow).has_value());
  REQUIRE(q.Enqueue(2, JobPriority::kNormal).has_value());
  REQUIRE(q.Enqueue(3, JobPriority::kHigh).has_value());
  REQUIRE(q.Enqueue(4, JobPriority::kNormal).has_value());

  // high first, then the rest in arrival order (low is not demoted)
  REQUIRE(DrainOrder(q) == std::vector<int>{3, 1, 2, 4});
}

TEST_CASE("JobQueue high items keep FIFO among themselves", "[job_queue]") {
  awp::JobQueue<int> q(10U);
  REQUIRE(q.Enqueue(1, JobPriority::kNormal).has_value());
  REQUIRE(q.Enqueue(2, JobPriority::kHigh).has_value());
  REQUIRE(q.Enqueue(3, JobPriority::kLow).has_value());
  REQUIRE(q.Enqueue(4, JobPriority::kHigh).has_value());
  REQUIRE(q.Enqueue(5, JobPriority::kHigh).has_value());
  REQUIRE(q.CountOf(JobPriority::kHigh) == 3U);
  REQUIRE(q.CountOf(JobPriority::kLow) == 1U);

  REQUIRE(DrainOrder(q) == std::vector<int>{2, 4, 5, 1, 3});
  REQUIRE(q.CountOf(JobPriority::kHigh) == 0U);
}

TEST_CASE("JobQueue high after partial drain", "[job_queue]") {
  awp::JobQueue<int> q(10U);
  REQUIRE(q.Enqueue(1, JobPriority::kHigh).has_value());
  REQUIRE(q.Enqueue(2, JobPriority::kNormal).has_value());
  REQUIRE(q.Dequeue().value() == 1);

  REQUIRE(q.Enqueue(3, JobPriority::kHigh).has_value());
  REQUIRE(DrainOrder(q) == std::vector<int>{3, 2});
}

TEST_CASE("JobQueue rejects at limit", "[job_queue]") {
  awp::JobQueue<int> q(2U);
  REQUIRE(q.Enqueue(1, JobPriority::kLow).has_value());
  REQUIRE(q.Enqueue(2, JobPriority::kLow).has_value());

  auto r = q.Enqueue(3, JobPriority::kHigh);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == awp::JobError::kQueueFull);
  REQUIRE(q.Size() == 2U);

  (void)q.Dequeue();
  REQUIRE(q.Enqueue(3, JobPriority::kHigh).has_value());
}

TEST_CASE("JobQueue Clear and Drain", "[job_queue]") {
  awp::JobQueue<std::string> q(8U);
  REQUIRE(q.Enqueue("a", JobPriority::kNormal).has_value());
  REQUIRE(q.Enqueue("b", JobPriority::kHigh).has_value());
  REQUIRE(q.Enqueue("c", JobPriority::kLow).has_value());

  auto drained = q.Drain();
  REQUIRE(drained == std::vector<std::string>{"b", "a", "c"});
  REQUIRE(q.Empty());

  REQUIRE(q.Enqueue("d", JobPriority::kHigh).has_value());
  REQUIRE(q.Enqueue("e", JobPriority::kNormal).has_value());
  REQUIRE(q.Clear() == 2U);
  REQUIRE(q.Empty());
  REQUIRE(q.CountOf(JobPriority::kHigh) == 0U);
}
