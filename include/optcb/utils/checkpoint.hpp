#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace optcb::utils {

// Checkpoint files hold a single JSON object keyed by iteration number
// ("5", "10", ...). Every call opens and closes the file.

// Adds or replaces `key`, creating the file if needed. The new contents are
// written to a sibling temporary file and renamed over `path`.
// Each call reads and rewrites the entire store, so the cost grows with the
// number and size of records already saved. Keep the checkpoint interval
// coarse when the state tensors are large.
void append_checkpoint(const std::filesystem::path& path, const std::string& key, const nlohmann::json& value);

nlohmann::json load_checkpoints(const std::filesystem::path& path);

// Numerically greatest key, or nothing if the file is missing or has no
// numeric keys.
std::optional<std::string> latest_checkpoint_key(const std::filesystem::path& path);
std::optional<nlohmann::json> load_latest_checkpoint(const std::filesystem::path& path);

}  // namespace optcb::utils
