#pragma once

#include <functional>

#include "optcb/actions/action.hpp"

namespace optcb::actions {

using ActionFn = std::function<void(const OptimizationState&, Scalar, Iteration, const Extra&)>;

class FunctionAction : public Action {
  public:
    explicit FunctionAction(ActionFn fn);

    void apply(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) override;

  private:
    ActionFn fn_;
};

}  // namespace optcb::actions
