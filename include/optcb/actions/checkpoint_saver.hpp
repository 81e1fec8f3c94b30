#pragma once

#include <filesystem>
#include <functional>

#include <nlohmann/json.hpp>

#include "optcb/actions/action.hpp"

namespace optcb::actions {

using CheckpointTransform = std::function<nlohmann::json(const OptimizationState&)>;

// {"shape": [...], "data": [...]} with data flattened in row-major order, or
// null for an undefined tensor.
nlohmann::json tensor_to_json(const Tensor& tensor);

// Whole-state snapshot: iter, u, objective and grad.
nlohmann::json snapshot_state(const OptimizationState& state);

struct CheckpointOptions {
    CheckpointTransform transform{snapshot_state};
    bool overwrite{false};
};

// Writes transform(state) under the key std::to_string(t) of a JSON
// checkpoint file. The file is opened and closed on every call, so each
// checkpoint is on disk before apply() returns.
//
// Construction fails if the file already exists, unless overwrite is set, in
// which case the old file is removed first.
class CheckPointSaver : public Action {
  public:
    explicit CheckPointSaver(std::filesystem::path filename, CheckpointOptions options = {});

    void apply(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) override;

    const std::filesystem::path& filename() const noexcept { return filename_; }

  private:
    std::filesystem::path filename_;
    CheckpointTransform transform_;
};

}  // namespace optcb::actions
