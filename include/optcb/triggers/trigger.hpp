#pragma once

#include <string>

#include "optcb/types.hpp"

namespace optcb::triggers {

// Decides, once per callback invocation, whether the callback's action runs.
// Implementations may mutate their own state inside fires(). Not thread-safe.
class Trigger {
  public:
    virtual ~Trigger() = default;

    virtual bool fires(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) = 0;

    // Return to construction-time state.
    virtual void reset() {}

    // Deliver a named event. Only event-driven triggers react.
    virtual void trigger(const std::string& /*event*/) {}
};

}  // namespace optcb::triggers
