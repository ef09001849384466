#pragma once

#include "voxrelay/common/result.hpp"

#include <filesystem>
#include <string>

namespace voxrelay::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
/// Expands a leading '~' and $VAR / ${VAR} references.
[[nodiscard]] std::string expand_path(std::string value);

} // namespace voxrelay::common
