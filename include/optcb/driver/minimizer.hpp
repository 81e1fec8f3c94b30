#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "optcb/callbacks/callback.hpp"
#include "optcb/callbacks/callback_registry.hpp"
#include "optcb/types.hpp"
#include "optcb/utils/config.hpp"

namespace optcb::driver {

enum class OptimizerKind {
    kAdam,
    kSgd,
    kLbfgs
};

OptimizerKind optimizer_kind_from_string(const std::string& name);

struct MinimizerOptions {
    std::string optimizer_name{"adam"};
    Scalar learning_rate{1e-3};
    int max_iterations{1000};
    std::vector<int> milestones{};
    Scalar gamma{0.1};
    Scalar gradient_clip_norm{0.0};
};

MinimizerOptions options_from_config(const utils::MinimizerConfig& config);

// Scalar objective of the parameter tensor, differentiable by autograd.
using Objective = std::function<Tensor(const Tensor&)>;

struct MinimizationResult {
    Tensor u;
    Scalar objective{0.0};
    Iteration iterations{0};
    bool stopped_by_callback{false};
};

// Reference optimization loop. Takes one optimizer step per iteration, then
// hands the resulting state and objective to the callback and stops when the
// callback asks to or the iteration budget runs out.
class Minimizer {
  public:
    Minimizer(Objective objective, MinimizerOptions options);

    MinimizationResult minimize(const Tensor& u0, callbacks::Callback& callback);
    MinimizationResult minimize(const Tensor& u0, callbacks::CallbackRegistry& callbacks);

  private:
    using StepCallback = std::function<bool(const OptimizationState&, Scalar)>;

    MinimizationResult run(const Tensor& u0, const StepCallback& callback);
    std::unique_ptr<torch::optim::Optimizer> make_optimizer(Tensor& u) const;
    void decay_learning_rate(torch::optim::Optimizer& optimizer) const;

    Objective objective_;
    MinimizerOptions options_;
    OptimizerKind kind_;
};

}  // namespace optcb::driver
