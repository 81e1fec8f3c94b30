#pragma once

#include <torch/torch.h>

#include <cstdint>
#include <memory>

#include <nlohmann/json.hpp>

namespace optcb {

using Tensor = torch::Tensor;
using Scalar = double;
using Iteration = std::int64_t;

// Opaque, read-only user context forwarded to every trigger, action and stop
// predicate. May be null.
using Extra = std::shared_ptr<const nlohmann::json>;

struct OptimizationState {
    Iteration iter{0};
    Tensor u;
    Scalar objective{0.0};
    Tensor grad;
};

}  // namespace optcb
