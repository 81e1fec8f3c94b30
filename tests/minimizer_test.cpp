#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "optcb/actions/function_action.hpp"
#include "optcb/callbacks/callback.hpp"
#include "optcb/callbacks/callback_registry.hpp"
#include "optcb/driver/minimizer.hpp"
#include "optcb/triggers/iteration_trigger.hpp"
#include "test_helpers.hpp"

namespace optcb::tests {

namespace {
Tensor shifted_quadratic(const Tensor& u) {
    return (u - 3.0).pow(2).sum();
}

driver::MinimizerOptions sgd(Scalar learning_rate, int max_iterations) {
    driver::MinimizerOptions options;
    options.optimizer_name = "sgd";
    options.learning_rate = learning_rate;
    options.max_iterations = max_iterations;
    return options;
}

callbacks::Callback quiet_callback(callbacks::CallbackOptions options = {}) {
    return callbacks::Callback{std::make_unique<triggers::IterationTrigger>(1), std::make_unique<RecordingAction>(),
                               std::move(options)};
}

// Parameter iterates reported to the callback, one per step, starting from zero.
std::vector<Tensor> iterates(const driver::MinimizerOptions& options) {
    std::vector<Tensor> seen;
    auto action = std::make_unique<actions::FunctionAction>(
        [&seen](const OptimizationState& state, Scalar, Iteration, const Extra&) { seen.push_back(state.u); });
    callbacks::Callback callback{std::make_unique<triggers::IterationTrigger>(1), std::move(action)};
    driver::Minimizer minimizer{shifted_quadratic, options};
    minimizer.minimize(torch::zeros({2}, torch::kDouble), callback);
    return seen;
}

}  // namespace

class MinimizerTests : public ::testing::Test {
  protected:
    Tensor start_{torch::zeros({2}, torch::kDouble)};
};

TEST_F(MinimizerTests, RejectsInvalidOptions) {
    EXPECT_THROW(driver::Minimizer(shifted_quadratic, sgd(0.0, 10)), std::invalid_argument);
    EXPECT_THROW(driver::Minimizer(shifted_quadratic, sgd(0.1, 0)), std::invalid_argument);
    EXPECT_THROW(driver::Minimizer(driver::Objective{}, sgd(0.1, 10)), std::invalid_argument);

    auto options = sgd(0.1, 10);
    options.optimizer_name = "newton";
    EXPECT_THROW(driver::Minimizer(shifted_quadratic, options), std::invalid_argument);
}

TEST_F(MinimizerTests, ParsesOptimizerNames) {
    EXPECT_EQ(driver::optimizer_kind_from_string("Adam"), driver::OptimizerKind::kAdam);
    EXPECT_EQ(driver::optimizer_kind_from_string("sgd"), driver::OptimizerKind::kSgd);
    EXPECT_EQ(driver::optimizer_kind_from_string("L-BFGS"), driver::OptimizerKind::kLbfgs);
}

TEST_F(MinimizerTests, OptionsFromConfig) {
    utils::MinimizerConfig config;
    config.optimizer = "lbfgs";
    config.learning_rate = 0.5;
    config.max_iterations = 42;
    config.milestones = {10, 20};
    config.gamma = 0.3;
    config.gradient_clip_norm = 1.5;

    const auto options = driver::options_from_config(config);

    EXPECT_EQ(options.optimizer_name, "lbfgs");
    EXPECT_DOUBLE_EQ(options.learning_rate, 0.5);
    EXPECT_EQ(options.max_iterations, 42);
    EXPECT_EQ(options.milestones, (std::vector<int>{10, 20}));
    EXPECT_DOUBLE_EQ(options.gamma, 0.3);
    EXPECT_DOUBLE_EQ(options.gradient_clip_norm, 1.5);
}

TEST_F(MinimizerTests, RejectsMilestonesWithLbfgs) {
    driver::MinimizerOptions options;
    options.optimizer_name = "lbfgs";
    options.learning_rate = 1.0;
    options.max_iterations = 5;
    options.milestones = {2};
    EXPECT_THROW(driver::Minimizer(shifted_quadratic, options), std::invalid_argument);

    options.milestones.clear();
    EXPECT_NO_THROW(driver::Minimizer(shifted_quadratic, options));
}

TEST_F(MinimizerTests, MilestoneDecaysLearningRate) {
    for (const std::string name : {"sgd", "adam"}) {
        SCOPED_TRACE(name);
        auto options = sgd(0.1, 5);
        options.optimizer_name = name;

        const auto decayed_options = [&] {
            auto with_milestone = options;
            with_milestone.milestones = {2};
            with_milestone.gamma = 0.0;
            return with_milestone;
        }();

        auto steady = iterates(options);
        auto decayed = iterates(decayed_options);
        ASSERT_EQ(steady.size(), 5u);
        ASSERT_EQ(decayed.size(), 5u);

        // Identical until the milestone, then frozen once the rate is zero.
        EXPECT_TRUE(torch::equal(decayed[0], steady[0]));
        EXPECT_TRUE(torch::equal(decayed[1], steady[1]));
        EXPECT_FALSE(torch::equal(decayed[1], decayed[0]));
        for (std::size_t i = 2; i < decayed.size(); ++i) {
            EXPECT_TRUE(torch::equal(decayed[i], decayed[1])) << "iteration " << i + 1;
            EXPECT_FALSE(torch::equal(steady[i], steady[i - 1])) << "iteration " << i + 1;
        }
    }
}

TEST_F(MinimizerTests, RunsFullBudgetWithoutStopRequest) {
    driver::Minimizer minimizer{shifted_quadratic, sgd(0.1, 200)};
    auto callback = quiet_callback();

    const auto result = minimizer.minimize(start_, callback);

    EXPECT_EQ(result.iterations, 200);
    EXPECT_FALSE(result.stopped_by_callback);
    EXPECT_EQ(callback.t(), 200);
    EXPECT_TRUE(torch::allclose(result.u, torch::full({2}, 3.0, torch::kDouble), 1e-8, 1e-8));
    EXPECT_NEAR(result.objective, 0.0, 1e-12);
}

TEST_F(MinimizerTests, StopsWhenCallbackAsks) {
    callbacks::CallbackOptions options;
    options.stop = [](const OptimizationState&, Scalar, Iteration t, const Extra&) { return t == 10; };
    auto callback = quiet_callback(options);
    driver::Minimizer minimizer{shifted_quadratic, sgd(0.1, 1000)};

    const auto result = minimizer.minimize(start_, callback);

    EXPECT_EQ(result.iterations, 10);
    EXPECT_TRUE(result.stopped_by_callback);
    EXPECT_EQ(callback.t(), 10);
}

TEST_F(MinimizerTests, ReportsStateAfterEachStep) {
    std::vector<Iteration> iterations;
    std::vector<Scalar> objectives;
    bool consistent = true;
    auto action = std::make_unique<actions::FunctionAction>(
        [&](const OptimizationState& state, Scalar value, Iteration t, const Extra&) {
            iterations.push_back(state.iter);
            objectives.push_back(value);
            consistent = consistent && state.iter == t && state.objective == value &&
                         state.objective == shifted_quadratic(state.u).item<double>();
        });
    callbacks::Callback callback{std::make_unique<triggers::IterationTrigger>(1), std::move(action)};
    driver::Minimizer minimizer{shifted_quadratic, sgd(0.1, 5)};

    minimizer.minimize(start_, callback);

    EXPECT_EQ(iterations, (std::vector<Iteration>{1, 2, 3, 4, 5}));
    EXPECT_TRUE(consistent);
    for (std::size_t i = 1; i < objectives.size(); ++i) {
        EXPECT_LT(objectives[i], objectives[i - 1]);
    }
}

TEST_F(MinimizerTests, ClipsGradientNorm) {
    auto options = sgd(1.0, 1);
    options.gradient_clip_norm = 0.1;
    Tensor step_grad;
    Tensor step_u;
    auto action = std::make_unique<actions::FunctionAction>([&](const OptimizationState& state, Scalar, Iteration, const Extra&) {
        step_grad = state.grad;
        step_u = state.u;
    });
    callbacks::Callback callback{std::make_unique<triggers::IterationTrigger>(1), std::move(action)};
    driver::Minimizer minimizer{shifted_quadratic, options};

    minimizer.minimize(torch::zeros({1}, torch::kDouble), callback);

    ASSERT_TRUE(step_grad.defined());
    EXPECT_NEAR(step_grad.item<double>(), -0.1, 1e-5);
    EXPECT_NEAR(step_u.item<double>(), 0.1, 1e-5);
}

TEST_F(MinimizerTests, LbfgsConvergesOnQuadratic) {
    driver::MinimizerOptions options;
    options.optimizer_name = "lbfgs";
    options.learning_rate = 1.0;
    options.max_iterations = 5;
    auto callback = quiet_callback();
    driver::Minimizer minimizer{shifted_quadratic, options};

    const auto result = minimizer.minimize(start_, callback);

    EXPECT_TRUE(torch::allclose(result.u, torch::full({2}, 3.0, torch::kDouble), 1e-6, 1e-6));
}

TEST_F(MinimizerTests, LeavesStartingPointUntouched) {
    driver::Minimizer minimizer{shifted_quadratic, sgd(0.1, 3)};
    auto callback = quiet_callback();

    minimizer.minimize(start_, callback);

    EXPECT_TRUE(torch::equal(start_, torch::zeros({2}, torch::kDouble)));
}

TEST_F(MinimizerTests, DrivesRegistry) {
    callbacks::CallbackRegistry registry;
    registry.add(quiet_callback());
    callbacks::CallbackOptions options;
    options.stop = [](const OptimizationState&, Scalar, Iteration t, const Extra&) { return t >= 3; };
    registry.add(quiet_callback(options));
    driver::Minimizer minimizer{shifted_quadratic, sgd(0.1, 100)};

    const auto result = minimizer.minimize(start_, registry);

    EXPECT_EQ(result.iterations, 3);
    EXPECT_TRUE(result.stopped_by_callback);
    EXPECT_EQ(registry.at(0).t(), 3);
}

TEST_F(MinimizerTests, ErrorsPropagateFromObjectiveAndCallback) {
    auto callback = quiet_callback();
    driver::Minimizer vector_valued{[](const Tensor& u) { return u * 2.0; }, sgd(0.1, 3)};
    EXPECT_THROW(vector_valued.minimize(start_, callback), std::invalid_argument);

    auto failing = callbacks::Callback{
        std::make_unique<triggers::IterationTrigger>(2),
        std::make_unique<actions::FunctionAction>([](const OptimizationState&, Scalar, Iteration, const Extra&) {
            throw std::runtime_error{"disk full"};
        })};
    driver::Minimizer minimizer{shifted_quadratic, sgd(0.1, 10)};
    EXPECT_THROW(minimizer.minimize(start_, failing), std::runtime_error);
    EXPECT_EQ(failing.t(), 2);
}

}  // namespace optcb::tests
