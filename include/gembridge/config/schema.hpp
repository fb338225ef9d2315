#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gembridge::config {

struct GeminiConfig {
  std::string binary = "gemini";
  std::int64_t default_timeout_secs = 600;
  std::optional<std::string> force_model;
  std::string prompt_file = "GEMINI.md";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  GeminiConfig gemini;
  ObservabilityConfig observability;
};

} // namespace gembridge::config
