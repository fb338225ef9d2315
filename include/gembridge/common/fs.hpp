#pragma once

#include "gembridge/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gembridge::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

} // namespace gembridge::common
