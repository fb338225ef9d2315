#pragma once

#include "gembridge/common/result.hpp"
#include "gembridge/gemini/types.hpp"

#include <string>
#include <vector>

namespace gembridge::gemini {

/// Rejects requests that must never reach a spawn: blank prompt, blank model
/// override, or a timeout outside [MIN_TIMEOUT_SECS, MAX_TIMEOUT_SECS].
[[nodiscard]] common::Status validate_options(const Options &options);

/// Command line for one invocation. The prompt is passed separately because
/// it may already carry the GEMINI.md prefix.
[[nodiscard]] std::vector<std::string> build_argv(const std::string &binary,
                                                  const Options &options,
                                                  const std::string &prompt);

} // namespace gembridge::gemini
