#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "optcb/actions/evaluator.hpp"
#include "optcb/callbacks/builder.hpp"
#include "optcb/callbacks/callback.hpp"
#include "optcb/callbacks/callback_registry.hpp"
#include "optcb/driver/minimizer.hpp"
#include "optcb/triggers/iteration_trigger.hpp"
#include "optcb/types.hpp"
#include "optcb/utils/checkpoint.hpp"
#include "optcb/utils/config.hpp"
#include "optcb/utils/logger.hpp"

namespace {
optcb::Tensor rosenbrock(const optcb::Tensor& x, double a, double b) {
    auto x0 = x[0];
    auto x1 = x[1];
    return (a - x0).pow(2) + b * (x1 - x0.pow(2)).pow(2);
}

}  // namespace

int main(int argc, char** argv) {
    using namespace optcb;
    namespace fs = std::filesystem;

    std::vector<fs::path> candidate_paths;
    if (argc > 1) {
        candidate_paths.emplace_back(argv[1]);
    }
    if (const char* env_path = std::getenv("OPTCB_CONFIG"); env_path != nullptr && env_path[0] != '\0') {
        candidate_paths.emplace_back(env_path);
    }
    candidate_paths.emplace_back("config/rosenbrock.json");
    candidate_paths.emplace_back("../config/rosenbrock.json");
    const fs::path binary_dir = fs::absolute(fs::path(argv[0])).parent_path();
    candidate_paths.emplace_back(binary_dir / "../config/rosenbrock.json");

    fs::path config_path;
    for (const auto& candidate : candidate_paths) {
        if (candidate.empty()) {
            continue;
        }
        auto absolute = fs::absolute(candidate);
        if (fs::exists(absolute)) {
            config_path = absolute;
            break;
        }
    }

    if (config_path.empty()) {
        std::cerr << "No configuration found; pass a path or set OPTCB_CONFIG." << std::endl;
        return 1;
    }

    try {
        auto config = utils::load_config(config_path);
        utils::Logger::instance().set_level(utils::log_level_from_string(config.logging.level));

        auto objective = [](const Tensor& x) { return rosenbrock(x, 1.0, 100.0); };

        auto registry = callbacks::make_registry(config.callbacks);

        // Track a perturbed objective alongside the configured callbacks.
        auto evaluator = std::make_unique<actions::Evaluator<>>(
            [](const OptimizationState& state) { return rosenbrock(state.u, 1.0, 90.0).item<double>(); });
        auto* evaluations = evaluator.get();
        registry.add(callbacks::Callback{std::make_unique<triggers::IterationTrigger>(500), std::move(evaluator)});

        driver::Minimizer minimizer{objective, driver::options_from_config(config.minimizer)};
        auto result = minimizer.minimize(torch::zeros({2}, torch::kDouble), registry);

        // Fire the "end" event once more so the final state lands in any
        // event-driven checkpoint.
        OptimizationState final_state;
        final_state.iter = result.iterations;
        final_state.u = result.u;
        final_state.objective = result.objective;
        optcb::trigger(registry, "end");
        registry(final_state, result.objective);

        std::cout << "u = [" << result.u[0].item<double>() << ", " << result.u[1].item<double>() << "]"
                  << ", objective = " << result.objective << std::endl;
        for (double value : evaluations->evaluations()) {
            std::cout << evaluations->label() << ": " << value << std::endl;
        }
        for (const auto& callback : config.callbacks) {
            if (callback.action.file.empty()) {
                continue;
            }
            if (auto key = utils::latest_checkpoint_key(callback.action.file)) {
                std::cout << "Latest checkpoint in " << callback.action.file << ": " << *key << std::endl;
            }
        }
    } catch (const std::exception& e) {
        utils::Logger::instance().error(e.what());
        return 1;
    }

    return 0;
}
