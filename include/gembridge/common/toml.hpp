#pragma once

#include "gembridge/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace gembridge::common {

/// Flat view of a TOML file: `[section]` headers are folded into dotted keys.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace gembridge::common
