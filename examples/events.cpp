#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "optcb/actions/function_action.hpp"
#include "optcb/callbacks/callback.hpp"
#include "optcb/triggers/event_trigger.hpp"
#include "optcb/triggers/time_trigger.hpp"
#include "optcb/types.hpp"
#include "optcb/utils/logger.hpp"

// Drives a callback by hand: only the iterations right after an event report
// their value.
int main() {
    using namespace optcb;

    auto report = [](const OptimizationState& /*state*/, Scalar value, Iteration t, const Extra& /*extra*/) {
        utils::Logger::instance().info("Iteration " + std::to_string(t) + ", current value: " + std::to_string(value));
    };

    callbacks::Callback callback{
        triggers::TriggerSet::of(std::make_unique<triggers::EventTrigger>(std::set<std::string>{"start", "end"}),
                                 std::make_unique<triggers::TimeTrigger>(2.0)),
        std::make_unique<actions::FunctionAction>(report)};

    OptimizationState state;
    utils::Logger::instance().info("Start.");
    optcb::trigger(callback, "start");
    callback(state, 10.0);
    callback(state, 9.0);
    callback(state, 7.0);
    optcb::trigger(callback, "end");
    callback(state, 6.0);

    std::cout << "Callback ran " << callback.t() << " iterations" << std::endl;
    return 0;
}
