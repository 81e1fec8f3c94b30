#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "optcb/callbacks/callback.hpp"
#include "optcb/callbacks/callback_registry.hpp"
#include "optcb/triggers/event_trigger.hpp"
#include "optcb/triggers/iteration_trigger.hpp"
#include "test_helpers.hpp"

namespace optcb::tests {

class CallbackRegistryTests : public ::testing::Test {
  protected:
    callbacks::Callback recording(Iteration interval, RecordingAction*& recorder, callbacks::CallbackOptions options = {}) {
        auto action = std::make_unique<RecordingAction>();
        recorder = action.get();
        return callbacks::Callback{std::make_unique<triggers::IterationTrigger>(interval), std::move(action), std::move(options)};
    }

    static callbacks::CallbackOptions stop_at(Iteration when) {
        callbacks::CallbackOptions options;
        options.stop = [when](const OptimizationState&, Scalar, Iteration t, const Extra&) { return t >= when; };
        return options;
    }

    OptimizationState state_{make_state()};
};

TEST_F(CallbackRegistryTests, EmptyRegistryNeverStops) {
    callbacks::CallbackRegistry registry;

    EXPECT_TRUE(registry.empty());
    EXPECT_FALSE(registry(state_, 1.0));
}

TEST_F(CallbackRegistryTests, InvokesEveryCallbackEvenAfterStopRequest) {
    RecordingAction* first = nullptr;
    RecordingAction* second = nullptr;
    callbacks::CallbackRegistry registry;
    registry.add(recording(1, first, stop_at(1)));
    registry.add(recording(1, second));

    EXPECT_TRUE(registry(state_, 1.0));

    EXPECT_EQ(first->fired, (std::vector<Iteration>{1}));
    EXPECT_EQ(second->fired, (std::vector<Iteration>{1}));
    EXPECT_EQ(registry.at(1).t(), 1);
}

TEST_F(CallbackRegistryTests, StopIsLogicalOr) {
    RecordingAction* first = nullptr;
    RecordingAction* second = nullptr;
    callbacks::CallbackRegistry registry;
    registry.add(recording(2, first, stop_at(3)));
    registry.add(recording(3, second));

    EXPECT_FALSE(registry(state_, 1.0));
    EXPECT_FALSE(registry(state_, 1.0));
    EXPECT_TRUE(registry(state_, 1.0));
    EXPECT_EQ(first->fired, (std::vector<Iteration>{2}));
    EXPECT_EQ(second->fired, (std::vector<Iteration>{3}));
}

TEST_F(CallbackRegistryTests, EventsAndResetReachEveryCallback) {
    auto first_action = std::make_unique<RecordingAction>();
    auto second_action = std::make_unique<RecordingAction>();
    auto* first = first_action.get();
    auto* second = second_action.get();
    callbacks::CallbackRegistry registry;
    registry.add(callbacks::Callback{std::make_unique<triggers::EventTrigger>(std::set<std::string>{"end"}), std::move(first_action)});
    registry.add(callbacks::Callback{std::make_unique<triggers::EventTrigger>(std::set<std::string>{"end"}), std::move(second_action)});

    optcb::trigger(registry, "end");
    registry(state_, 1.0);
    registry(state_, 1.0);

    EXPECT_EQ(first->fired, (std::vector<Iteration>{1}));
    EXPECT_EQ(second->fired, (std::vector<Iteration>{1}));

    auto& same = registry.reset();
    EXPECT_EQ(&same, &registry);
    EXPECT_EQ(registry.at(0).t(), 0);
    EXPECT_EQ(registry.at(1).t(), 0);
}

}  // namespace optcb::tests
