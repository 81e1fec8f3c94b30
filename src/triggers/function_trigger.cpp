#include "optcb/triggers/function_trigger.hpp"

#include <stdexcept>
#include <utility>

namespace optcb::triggers {

FunctionTrigger::FunctionTrigger(TriggerFn predicate) : predicate_{std::move(predicate)} {
    if (!predicate_) {
        throw std::invalid_argument{"Function trigger requires a predicate"};
    }
}

bool FunctionTrigger::fires(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) {
    return predicate_(state, value, t, extra);
}

}  // namespace optcb::triggers
