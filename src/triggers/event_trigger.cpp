#include "optcb/triggers/event_trigger.hpp"

#include <utility>

namespace optcb::triggers {

EventTrigger::EventTrigger(std::set<std::string> events) : events_{std::move(events)} {}

bool EventTrigger::fires(const OptimizationState& /*state*/, Scalar /*value*/, Iteration /*t*/, const Extra& /*extra*/) {
    if (latched_) {
        latched_ = false;
        return true;
    }
    return false;
}

void EventTrigger::reset() {
    latched_ = false;
}

void EventTrigger::trigger(const std::string& event) {
    latched_ = events_.count(event) > 0;
}

}  // namespace optcb::triggers
