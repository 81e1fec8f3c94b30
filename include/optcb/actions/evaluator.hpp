#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "optcb/actions/action.hpp"

namespace optcb::actions {

// Records f(state) on every call. The history is kept for the lifetime of the
// evaluator; reset() leaves it untouched.
template <typename T = Scalar>
class Evaluator : public Action {
  public:
    using EvaluationFn = std::function<T(const OptimizationState&)>;

    explicit Evaluator(EvaluationFn f, std::string label = "evaluation")
        : label_{std::move(label)}, f_{std::move(f)} {
        if (!f_) {
            throw std::invalid_argument{"Evaluator requires a callable"};
        }
    }

    void apply(const OptimizationState& state, Scalar /*value*/, Iteration /*t*/, const Extra& /*extra*/) override {
        evaluations_.push_back(f_(state));
    }

    const std::string& label() const noexcept { return label_; }
    const std::vector<T>& evaluations() const noexcept { return evaluations_; }

  private:
    std::string label_;
    std::vector<T> evaluations_;
    EvaluationFn f_;
};

}  // namespace optcb::actions
