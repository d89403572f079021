#pragma once

#include "tgassist/common/result.hpp"
#include "tgassist/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace tgassist::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Reads the TOML file (when present), then applies environment overrides.
[[nodiscard]] common::Result<Config> load_config();

/// BOT_TOKEN, ALLOWED_CHAT_IDS, AUTHORIZED_USER_IDS, DEVICE_MODEL_ID and
/// DEVICE_ID take precedence over the file. Fails on malformed id lists.
[[nodiscard]] common::Status apply_env_overrides(Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

} // namespace tgassist::config
