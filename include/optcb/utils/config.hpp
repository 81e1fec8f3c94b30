#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace optcb::utils {

struct LoggingConfig {
    std::string level{"info"};
};

struct MinimizerConfig {
    std::string optimizer{"adam"};
    double learning_rate{1e-3};
    int max_iterations{1000};
    std::vector<int> milestones{};
    double gamma{0.1};
    double gradient_clip_norm{0.0};
};

struct TriggerConfig {
    std::string type{"iteration"};
    long long interval{1};
    double seconds{1.0};
    std::vector<std::string> events{};
};

struct ActionConfig {
    std::string type{"log_progress"};
    std::filesystem::path file{};
    bool overwrite{false};
};

struct CallbackConfig {
    std::vector<TriggerConfig> triggers{};
    ActionConfig action{};
};

struct ConfigBundle {
    LoggingConfig logging;
    MinimizerConfig minimizer;
    std::vector<CallbackConfig> callbacks;
    nlohmann::json raw;
};

ConfigBundle parse_config(const nlohmann::json& json);
ConfigBundle load_config(const std::filesystem::path& path);

}  // namespace optcb::utils
