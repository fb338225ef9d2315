#pragma once

#include "gembridge/common/result.hpp"
#include "gembridge/config/schema.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gembridge::config {

/// Looks up an environment variable; injectable so tests never touch the
/// process environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

[[nodiscard]] EnvLookup process_env();

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Loads the optional TOML config file, then applies environment overrides.
/// A missing file yields defaults.
[[nodiscard]] common::Result<Config> load_config(const EnvLookup &env = process_env());
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config, const EnvLookup &env);

} // namespace gembridge::config
