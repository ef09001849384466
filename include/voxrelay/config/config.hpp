#pragma once

#include "voxrelay/common/result.hpp"
#include "voxrelay/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace voxrelay::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
/// Parses TOML text without touching the filesystem or the environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// Fails on settings the runtime cannot honor; the value holds warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Backends the generator factory knows how to build.
[[nodiscard]] const std::vector<std::string> &known_generator_backends();

} // namespace voxrelay::config
