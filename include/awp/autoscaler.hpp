/**
 * @file autoscaler.hpp
 * @brief Load-driven pool sizing decision.
 *
 * The Autoscaler only decides; the pool executes the intent (spawn one /
 * retire one idle worker) inside its own serialized section. At most one
 * step per tick, and the two thresholds form a hysteresis band so the pool
 * does not flap around a boundary.
 */

#ifndef AWP_AUTOSCALER_HPP_
#define AWP_AUTOSCALER_HPP_

#include <cstdint>

namespace awp {

enum class ScaleAction : uint8_t {
  kNone = 0U,
  kGrow,
  kShrink,
};

/// Pool occupancy observed at the start of a tick.
struct ScaleInput {
  uint32_t queued{0U};
  uint32_t idle{0U};
  uint32_t size{0U};
};

struct ScaleDecision {
  ScaleAction action{ScaleAction::kNone};
  uint32_t target_size{0U};
};

struct AutoscalePolicy {
  uint32_t min_size{1U};
  uint32_t max_size{8U};
  uint32_t scale_up_queue_threshold{2U};
  uint32_t scale_down_idle_threshold{2U};
};

class Autoscaler final {
 public:
  explicit Autoscaler(const AutoscalePolicy& policy) noexcept : policy_(policy) {}

  /**
   * Scale-up is checked first: queued > up_threshold and size < max grows
   * by one. Otherwise idle > down_threshold and size > min shrinks by one.
   */
  ScaleDecision Evaluate(const ScaleInput& in) const noexcept {
    ScaleDecision d;
    d.target_size = in.size;
    if (in.queued > policy_.scale_up_queue_threshold && in.size < policy_.max_size) {
      d.action = ScaleAction::kGrow;
      d.target_size = in.size + 1U;
      return d;
    }
    if (in.idle > policy_.scale_down_idle_threshold && in.size > policy_.min_size) {
      d.action = ScaleAction::kShrink;
      d.target_size = in.size - 1U;
    }
    return d;
  }

  const AutoscalePolicy& Policy() const noexcept { return policy_; }

 private:
  AutoscalePolicy policy_;
};

inline const char* ScaleActionName(ScaleAction a) noexcept {
  switch (a) {
    case ScaleAction::kNone:
      return "none";
    case ScaleAction::kGrow:
      return "grow";
    case ScaleAction::kShrink:
      return "shrink";
  }
  return "?";
}

}  // namespace awp

#endif  // AWP_AUTOSCALER_HPP_
