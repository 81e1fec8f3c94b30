#include "optcb/actions/function_action.hpp"

#include <stdexcept>
#include <utility>

namespace optcb::actions {

FunctionAction::FunctionAction(ActionFn fn) : fn_{std::move(fn)} {
    if (!fn_) {
        throw std::invalid_argument{"Function action requires a callable"};
    }
}

void FunctionAction::apply(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) {
    fn_(state, value, t, extra);
}

}  // namespace optcb::actions
