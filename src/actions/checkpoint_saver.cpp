#include "optcb/actions/checkpoint_saver.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "optcb/utils/checkpoint.hpp"
#include "optcb/utils/logger.hpp"

namespace optcb::actions {

nlohmann::json tensor_to_json(const Tensor& tensor) {
    if (!tensor.defined()) {
        return nullptr;
    }
    auto flat = tensor.detach().to(torch::kCPU).to(torch::kDouble).contiguous().reshape({-1});
    const double* begin = flat.data_ptr<double>();
    std::vector<double> data(begin, begin + flat.numel());
    std::vector<int64_t> shape = tensor.sizes().vec();

    nlohmann::json json;
    json["shape"] = shape;
    json["data"] = data;
    return json;
}

nlohmann::json snapshot_state(const OptimizationState& state) {
    nlohmann::json json;
    json["iter"] = state.iter;
    json["u"] = tensor_to_json(state.u);
    json["objective"] = state.objective;
    json["grad"] = tensor_to_json(state.grad);
    return json;
}

CheckPointSaver::CheckPointSaver(std::filesystem::path filename, CheckpointOptions options)
    : filename_{std::move(filename)}, transform_{std::move(options.transform)} {
    if (filename_.empty()) {
        throw std::invalid_argument{"Checkpoint filename must not be empty"};
    }
    if (!transform_) {
        throw std::invalid_argument{"Checkpoint transform must be callable"};
    }
    if (std::filesystem::exists(filename_)) {
        if (!options.overwrite) {
            throw std::runtime_error{"File " + filename_.string() + " exists. Set overwrite to replace it"};
        }
        std::filesystem::remove(filename_);
        utils::Logger::instance().warn("Removed existing checkpoint file " + filename_.string());
    }
}

void CheckPointSaver::apply(const OptimizationState& state, Scalar /*value*/, Iteration t, const Extra& /*extra*/) {
    utils::append_checkpoint(filename_, std::to_string(t), transform_(state));
}

}  // namespace optcb::actions
