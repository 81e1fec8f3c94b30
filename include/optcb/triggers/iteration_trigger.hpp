#pragma once

#include "optcb/triggers/trigger.hpp"

namespace optcb::triggers {

// Fires every `interval` iterations, first at t == interval.
class IterationTrigger : public Trigger {
  public:
    explicit IterationTrigger(Iteration interval);

    bool fires(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) override;
    void reset() override;

    Iteration interval() const noexcept { return interval_; }
    Iteration last_fire() const noexcept { return last_fire_; }

  private:
    Iteration last_fire_{0};
    Iteration interval_;
};

}  // namespace optcb::triggers
