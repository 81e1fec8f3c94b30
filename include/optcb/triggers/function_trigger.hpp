#pragma once

#include <functional>

#include "optcb/triggers/trigger.hpp"

namespace optcb::triggers {

using TriggerFn = std::function<bool(const OptimizationState&, Scalar, Iteration, const Extra&)>;

// Adapts a user predicate. Whatever the predicate throws reaches the caller.
class FunctionTrigger : public Trigger {
  public:
    explicit FunctionTrigger(TriggerFn predicate);

    bool fires(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) override;

  private:
    TriggerFn predicate_;
};

}  // namespace optcb::triggers
