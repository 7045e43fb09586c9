/**
 * @file test_autoscaler.cpp
 * @brief Tests for autoscaler.hpp
 */

#include "awp/autoscaler.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>

namespace {

awp::AutoscalePolicy MakePolicy(uint32_t min, uint32_t max) {
  awp::AutoscalePolicy p;
  p.min_size = min;
  p.max_size = max;
  p.scale_up_queue_threshold = 2U;
  p.scale_down_idle_threshold = 2U;
  return p;
}

awp::ScaleInput In(uint32_t queued, uint32_t idle, uint32_t size) {
  awp::ScaleInput in;
  in.queued = queued;
  in.idle = idle;
  in.size = size;
  return in;
}

}  // namespace

TEST_CASE("Autoscaler grows by one above queue threshold", "[autoscaler]") {
  awp::Autoscaler as(MakePolicy(1U, 8U));
  auto d = as.Evaluate(In(3U, 0U, 3U));
  REQUIRE(d.action == awp::ScaleAction::kGrow);
  REQUIRE(d.target_size == 4U);
}

TEST_CASE("Autoscaler threshold is exclusive", "[autoscaler]") {
  awp::Autoscaler as(MakePolicy(1U, 8U));
  REQUIRE(as.Evaluate(In(2U, 0U, 3U)).action == awp::ScaleAction::kNone);
  REQUIRE(as.Evaluate(In(0U, 2U, 3U)).action == awp::ScaleAction::kNone);
}

TEST_CASE("Autoscaler never grows past max", "[autoscaler]") {
  awp::Autoscaler as(MakePolicy(1U, 4U));
  auto d = as.Evaluate(In(50U, 0U, 4U));
  REQUIRE(d.action == awp::ScaleAction::kNone);
  REQUIRE(d.target_size == 4U);
}

TEST_CASE("Autoscaler shrinks by one above idle threshold", "[autoscaler]") {
  awp::Autoscaler as(MakePolicy(1U, 8U));
  auto d = as.Evaluate(In(0U, 3U, 5U));
  REQUIRE(d.action == awp::ScaleAction::kShrink);
  REQUIRE(d.target_size == 4U);
}

TEST_CASE("Autoscaler never shrinks below min", "[autoscaler]") {
  awp::Autoscaler as(MakePolicy(3U, 8U));
  auto d = as.Evaluate(In(0U, 3U, 3U));
  REQUIRE(d.action == awp::ScaleAction::kNone);
  REQUIRE(d.target_size == 3U);
}

TEST_CASE("Autoscaler checks scale-up first", "[autoscaler]") {
  awp::Autoscaler as(MakePolicy(1U, 8U));
  // Both conditions hold: growth wins
  auto d = as.Evaluate(In(5U, 5U, 5U));
  REQUIRE(d.action == awp::ScaleAction::kGrow);
  REQUIRE(d.target_size == 6U);

  // At max, the idle condition is then applied
  awp::Autoscaler capped(MakePolicy(1U, 5U));
  auto d2 = capped.Evaluate(In(5U, 5U, 5U));
  REQUIRE(d2.action == awp::ScaleAction::kShrink);
  REQUIRE(d2.target_size == 4U);
}

TEST_CASE("Autoscaler action names", "[autoscaler]") {
  REQUIRE(std::strcmp(awp::ScaleActionName(awp::ScaleAction::kGrow), "grow") == 0);
  REQUIRE(std::strcmp(awp::ScaleActionName(awp::ScaleAction::kShrink), "shrink") == 0);
  REQUIRE(std::strcmp(awp::ScaleActionName(awp::ScaleAction::kNone), "none") == 0);
}
