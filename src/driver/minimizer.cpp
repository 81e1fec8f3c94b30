#include "optcb/driver/minimizer.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include <torch/nn/utils/clip_grad.h>
#include <torch/torch.h>

#include "optcb/utils/logger.hpp"

namespace optcb::driver {

OptimizerKind optimizer_kind_from_string(const std::string& name) {
    const auto lower = utils::to_lower(name);
    if (lower == "adam") {
        return OptimizerKind::kAdam;
    }
    if (lower == "sgd") {
        return OptimizerKind::kSgd;
    }
    if (lower == "lbfgs" || lower == "l-bfgs") {
        return OptimizerKind::kLbfgs;
    }
    throw std::invalid_argument{"Unsupported optimizer: " + name};
}

MinimizerOptions options_from_config(const utils::MinimizerConfig& config) {
    MinimizerOptions options;
    options.optimizer_name = config.optimizer;
    options.learning_rate = static_cast<Scalar>(config.learning_rate);
    options.max_iterations = config.max_iterations;
    options.milestones = config.milestones;
    options.gamma = static_cast<Scalar>(config.gamma);
    options.gradient_clip_norm = static_cast<Scalar>(config.gradient_clip_norm);
    return options;
}

Minimizer::Minimizer(Objective objective, MinimizerOptions options)
    : objective_{std::move(objective)},
      options_{std::move(options)},
      kind_{optimizer_kind_from_string(options_.optimizer_name)} {
    if (!objective_) {
        throw std::invalid_argument{"Minimizer requires an objective"};
    }
    if (!(options_.learning_rate > 0.0)) {
        throw std::invalid_argument{"Learning rate must be positive"};
    }
    if (options_.max_iterations <= 0) {
        throw std::invalid_argument{"Iteration budget must be positive"};
    }
    if (kind_ == OptimizerKind::kLbfgs && !options_.milestones.empty()) {
        throw std::invalid_argument{"Learning rate milestones are not supported with lbfgs"};
    }
}

std::unique_ptr<torch::optim::Optimizer> Minimizer::make_optimizer(Tensor& u) const {
    std::vector<Tensor> params{u};
    switch (kind_) {
        case OptimizerKind::kSgd:
            return std::make_unique<torch::optim::SGD>(params, torch::optim::SGDOptions(options_.learning_rate));
        case OptimizerKind::kLbfgs:
            return std::make_unique<torch::optim::LBFGS>(params, torch::optim::LBFGSOptions(options_.learning_rate));
        case OptimizerKind::kAdam:
        default:
            return std::make_unique<torch::optim::Adam>(params, torch::optim::AdamOptions(options_.learning_rate));
    }
}

void Minimizer::decay_learning_rate(torch::optim::Optimizer& optimizer) const {
    if (auto* adam = dynamic_cast<torch::optim::Adam*>(&optimizer)) {
        for (auto& group : adam->param_groups()) {
            auto& options = static_cast<torch::optim::AdamOptions&>(group.options());
            options.lr(options.lr() * options_.gamma);
        }
        return;
    }
    if (auto* sgd = dynamic_cast<torch::optim::SGD*>(&optimizer)) {
        for (auto& group : sgd->param_groups()) {
            auto& options = static_cast<torch::optim::SGDOptions&>(group.options());
            options.lr(options.lr() * options_.gamma);
        }
    }
}

MinimizationResult Minimizer::run(const Tensor& u0, const StepCallback& callback) {
    Tensor u = u0.detach().to(torch::kDouble).clone();
    u.set_requires_grad(true);
    auto optimizer = make_optimizer(u);

    std::unordered_set<int> milestones(options_.milestones.begin(), options_.milestones.end());

    auto closure = [&]() -> Tensor {
        optimizer->zero_grad();
        auto loss = objective_(u);
        if (loss.numel() != 1) {
            throw std::invalid_argument{"Objective must return a scalar tensor"};
        }
        loss.backward();
        if (options_.gradient_clip_norm > 0.0) {
            torch::nn::utils::clip_grad_norm_(u, options_.gradient_clip_norm);
        }
        return loss;
    };

    utils::Logger::instance().info("Starting minimization with " + options_.optimizer_name + " for at most " +
                                   std::to_string(options_.max_iterations) + " iterations");

    MinimizationResult result;
    for (int iter = 1; iter <= options_.max_iterations; ++iter) {
        optimizer->step(closure);

        // Report the objective at the updated point; grad is the gradient the
        // step was taken with.
        OptimizationState state;
        state.iter = iter;
        state.u = u.detach().clone();
        state.grad = u.grad().defined() ? u.grad().detach().clone() : Tensor{};
        {
            torch::NoGradGuard no_grad;
            state.objective = objective_(u).item<double>();
        }

        result.iterations = iter;
        result.objective = state.objective;

        if (callback(state, state.objective)) {
            result.stopped_by_callback = true;
            break;
        }

        if (milestones.count(iter) > 0) {
            decay_learning_rate(*optimizer);
        }
    }

    result.u = u.detach().clone();
    utils::Logger::instance().info("Minimization finished after " + std::to_string(result.iterations) +
                                   " iterations, objective " + std::to_string(result.objective) +
                                   (result.stopped_by_callback ? " (stopped by callback)" : ""));
    return result;
}

MinimizationResult Minimizer::minimize(const Tensor& u0, callbacks::Callback& callback) {
    return run(u0, [&callback](const OptimizationState& state, Scalar value) { return callback(state, value); });
}

MinimizationResult Minimizer::minimize(const Tensor& u0, callbacks::CallbackRegistry& callbacks) {
    return run(u0, [&callbacks](const OptimizationState& state, Scalar value) { return callbacks(state, value); });
}

}  // namespace optcb::driver
