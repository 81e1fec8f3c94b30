#include "optcb/utils/checkpoint.hpp"

#include <filesystem>
#include <fstream>
#include <regex>
#include <stdexcept>

#include "optcb/utils/logger.hpp"

namespace optcb::utils {

namespace {
nlohmann::json read_object(const std::filesystem::path& path) {
    std::ifstream stream{path};
    if (!stream) {
        throw std::runtime_error{"Failed to open checkpoint file: " + path.string()};
    }
    nlohmann::json json;
    try {
        stream >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error{"Corrupt checkpoint file " + path.string() + ": " + e.what()};
    }
    if (!json.is_object()) {
        throw std::runtime_error{"Checkpoint file does not hold a JSON object: " + path.string()};
    }
    return json;
}

std::optional<std::string> latest_key(const nlohmann::json& contents) {
    const std::regex pattern{"[0-9]+"};
    std::optional<std::string> latest;
    long long best = -1;

    for (const auto& item : contents.items()) {
        if (!std::regex_match(item.key(), pattern)) {
            continue;
        }
        const long long iteration = std::stoll(item.key());
        if (iteration > best) {
            best = iteration;
            latest = item.key();
        }
    }
    return latest;
}

}  // namespace

void append_checkpoint(const std::filesystem::path& path, const std::string& key, const nlohmann::json& value) {
    auto contents = std::filesystem::exists(path) ? read_object(path) : nlohmann::json::object();
    contents[key] = value;

    auto staging = path;
    staging += ".tmp";
    {
        std::ofstream stream{staging, std::ios::trunc};
        if (!stream) {
            throw std::runtime_error{"Failed to open checkpoint file for writing: " + staging.string()};
        }
        stream << contents.dump();
        stream.flush();
        if (!stream) {
            throw std::runtime_error{"Failed to write checkpoint file: " + staging.string()};
        }
    }
    std::filesystem::rename(staging, path);
    Logger::instance().debug("Saved checkpoint " + key + " to " + path.string());
}

nlohmann::json load_checkpoints(const std::filesystem::path& path) {
    return read_object(path);
}

std::optional<std::string> latest_checkpoint_key(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    return latest_key(read_object(path));
}

std::optional<nlohmann::json> load_latest_checkpoint(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    auto contents = read_object(path);
    const auto key = latest_key(contents);
    if (!key) {
        return std::nullopt;
    }
    Logger::instance().info("Loaded checkpoint " + *key + " from " + path.string());
    return contents.at(*key);
}

}  // namespace optcb::utils
