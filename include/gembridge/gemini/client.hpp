#pragma once

#include "gembridge/common/result.hpp"
#include "gembridge/config/schema.hpp"
#include "gembridge/gemini/deadline.hpp"
#include "gembridge/gemini/prompt.hpp"
#include "gembridge/gemini/supervisor.hpp"
#include "gembridge/gemini/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace gembridge::gemini {

struct ClientConfig {
  std::string binary = "gemini";
  std::chrono::seconds default_timeout{DEFAULT_TIMEOUT_SECS};
  /// Model used when a request does not name one.
  std::optional<std::string> force_model;
  /// Empty disables the prompt prefix.
  std::filesystem::path prompt_prefix_path = DEFAULT_PROMPT_FILE;
};

[[nodiscard]] ClientConfig client_config_from(const config::Config &config);

/// Validates a request, assembles the command line and supervises one run of
/// the gemini binary. Holds no state between runs, so one client may serve
/// concurrent callers.
class GeminiClient {
public:
  explicit GeminiClient(ClientConfig config);

  [[nodiscard]] common::Result<GeminiResult> run(const Options &options) const;

  [[nodiscard]] const ClientConfig &config() const { return config_; }

private:
  ClientConfig config_;
  Supervisor supervisor_;
};

} // namespace gembridge::gemini
