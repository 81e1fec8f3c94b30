#pragma once

#include <functional>
#include <optional>

#include "optcb/triggers/trigger.hpp"

namespace optcb::triggers {

// Seconds on an arbitrary monotonic origin.
using ClockFn = std::function<double()>;

ClockFn steady_clock_seconds();

// Fires when more than `interval` seconds of wall-clock time have passed since
// the last fire. The first call only starts the timer and never fires.
class TimeTrigger : public Trigger {
  public:
    explicit TimeTrigger(double interval, ClockFn clock = steady_clock_seconds());

    bool fires(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) override;
    void reset() override;

    double interval() const noexcept { return interval_; }
    const std::optional<double>& last_fire_time() const noexcept { return last_fire_time_; }

  private:
    std::optional<double> last_fire_time_;
    double interval_;
    ClockFn clock_;
};

}  // namespace optcb::triggers
