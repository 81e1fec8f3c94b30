#pragma once

#include "optcb/types.hpp"

namespace optcb::actions {

// Side effect run by a Callback whenever its triggers fire.
class Action {
  public:
    virtual ~Action() = default;

    virtual void apply(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) = 0;

    // Return to construction-time state. Actions without resettable state
    // keep the default.
    virtual void reset() {}
};

}  // namespace optcb::actions
