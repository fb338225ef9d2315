#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gembridge::gemini {

constexpr std::size_t MAX_CAPTURED_EVENTS = 10'000;
constexpr std::size_t MAX_NON_JSON_LINES = 1'000;
constexpr std::size_t MAX_STDERR_BYTES = 100'000;

/// One invocation of the gemini CLI as requested by a caller.
struct Options {
  std::string prompt;
  bool sandbox = false;
  std::optional<std::string> session_id;
  bool return_all_messages = false;
  std::optional<std::string> model;
  std::optional<std::int64_t> timeout_secs;
};

/// Aggregated outcome of one invocation. Built by the supervisor while the
/// child runs, sealed by finalize().
struct GeminiResult {
  bool success = true;
  std::string session_id;
  std::string agent_messages;
  /// Raw JSON text of every captured event, in arrival order.
  std::vector<std::string> all_messages;
  bool return_all_messages = false;
  std::optional<std::string> error;

  void mark_failed() { success = false; }
};

} // namespace gembridge::gemini
