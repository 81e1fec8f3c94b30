#include "optcb/utils/config.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "optcb/utils/logger.hpp"

namespace optcb::utils {

namespace {
std::vector<int> read_optional_int_vector(const nlohmann::json& node, const char* key) {
    if (!node.contains(key)) {
        return {};
    }
    return node.at(key).get<std::vector<int>>();
}

std::vector<std::string> read_optional_string_vector(const nlohmann::json& node, const char* key) {
    if (!node.contains(key)) {
        return {};
    }
    return node.at(key).get<std::vector<std::string>>();
}

std::string read_optional_string(const nlohmann::json& node, const char* key, const std::string& fallback) {
    if (node.contains(key)) {
        return node.at(key).get<std::string>();
    }
    return fallback;
}

long long read_optional_integer(const nlohmann::json& node, const char* key, long long fallback) {
    if (!node.contains(key)) {
        return fallback;
    }
    const auto& value = node.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument{std::string{"\""} + key + "\" must be an integer, got " + value.dump()};
    }
    return value.get<long long>();
}

TriggerConfig read_trigger(const nlohmann::json& node) {
    TriggerConfig trigger;
    trigger.type = read_optional_string(node, "type", trigger.type);
    trigger.interval = read_optional_integer(node, "interval", trigger.interval);
    trigger.seconds = node.value("seconds", trigger.seconds);
    trigger.events = read_optional_string_vector(node, "events");
    return trigger;
}

ActionConfig read_action(const nlohmann::json& node) {
    ActionConfig action;
    action.type = read_optional_string(node, "type", action.type);
    if (node.contains("file")) {
        action.file = std::filesystem::path{node.at("file").get<std::string>()};
    }
    action.overwrite = node.value("overwrite", action.overwrite);
    return action;
}

}  // namespace

ConfigBundle parse_config(const nlohmann::json& json) {
    ConfigBundle bundle;
    bundle.raw = json;

    if (json.contains("logging")) {
        const auto& logging = json.at("logging");
        bundle.logging.level = read_optional_string(logging, "level", bundle.logging.level);
    }

    if (json.contains("minimizer")) {
        const auto& minimizer = json.at("minimizer");
        bundle.minimizer.optimizer = read_optional_string(minimizer, "optimizer", bundle.minimizer.optimizer);
        bundle.minimizer.learning_rate = minimizer.value("lr", bundle.minimizer.learning_rate);
        bundle.minimizer.max_iterations =
            static_cast<int>(read_optional_integer(minimizer, "max_iterations", bundle.minimizer.max_iterations));
        if (minimizer.contains("lr_schedule")) {
            const auto& schedule = minimizer.at("lr_schedule");
            bundle.minimizer.milestones = read_optional_int_vector(schedule, "milestones");
            bundle.minimizer.gamma = schedule.value("gamma", bundle.minimizer.gamma);
        }
        bundle.minimizer.gradient_clip_norm = minimizer.value("gradient_clip_norm", bundle.minimizer.gradient_clip_norm);
    }

    if (json.contains("callbacks")) {
        const auto& callbacks = json.at("callbacks");
        if (!callbacks.is_array()) {
            throw std::invalid_argument{"\"callbacks\" must be an array"};
        }
        for (const auto& node : callbacks) {
            CallbackConfig callback;
            if (node.contains("triggers")) {
                for (const auto& trigger : node.at("triggers")) {
                    callback.triggers.push_back(read_trigger(trigger));
                }
            }
            if (node.contains("action")) {
                callback.action = read_action(node.at("action"));
            }
            bundle.callbacks.push_back(std::move(callback));
        }
    }

    return bundle;
}

ConfigBundle load_config(const std::filesystem::path& path) {
    auto absolute_path = std::filesystem::absolute(path);
    std::ifstream stream{absolute_path};
    if (!stream) {
        throw std::runtime_error{"Failed to open config file: " + absolute_path.string()};
    }

    nlohmann::json json;
    stream >> json;

    auto bundle = parse_config(json);
    Logger::instance().info("Loaded configuration from " + absolute_path.string());

    return bundle;
}

}  // namespace optcb::utils
