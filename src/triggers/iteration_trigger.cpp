#include "optcb/triggers/iteration_trigger.hpp"

#include <stdexcept>
#include <string>

namespace optcb::triggers {

IterationTrigger::IterationTrigger(Iteration interval) : interval_{interval} {
    if (interval_ <= 0) {
        throw std::invalid_argument{"Iteration trigger interval must be positive, got " + std::to_string(interval_)};
    }
}

bool IterationTrigger::fires(const OptimizationState& /*state*/, Scalar /*value*/, Iteration t, const Extra& /*extra*/) {
    if (t - last_fire_ >= interval_) {
        last_fire_ = t;
        return true;
    }
    return false;
}

void IterationTrigger::reset() {
    last_fire_ = 0;
}

}  // namespace optcb::triggers
