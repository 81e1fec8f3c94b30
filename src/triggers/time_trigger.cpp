#include "optcb/triggers/time_trigger.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace optcb::triggers {

ClockFn steady_clock_seconds() {
    return [] {
        using clock = std::chrono::steady_clock;
        return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
    };
}

TimeTrigger::TimeTrigger(double interval, ClockFn clock)
    : interval_{interval}, clock_{std::move(clock)} {
    if (!std::isfinite(interval_) || interval_ <= 0.0) {
        throw std::invalid_argument{"Time trigger interval must be a positive number of seconds, got " + std::to_string(interval_)};
    }
    if (!clock_) {
        throw std::invalid_argument{"Time trigger requires a clock"};
    }
}

bool TimeTrigger::fires(const OptimizationState& /*state*/, Scalar /*value*/, Iteration /*t*/, const Extra& /*extra*/) {
    const double now = clock_();
    if (!last_fire_time_) {
        last_fire_time_ = now;
        return false;
    }
    if (now - *last_fire_time_ > interval_) {
        last_fire_time_ = now;
        return true;
    }
    return false;
}

void TimeTrigger::reset() {
    last_fire_time_.reset();
}

}  // namespace optcb::triggers
