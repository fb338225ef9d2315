#pragma once

#include "gembridge/common/json_util.hpp"
#include "gembridge/gemini/types.hpp"

#include <optional>
#include <string>

namespace gembridge::gemini {

constexpr const char *PROMPT_DEPRECATION_WARNING = "The --prompt (-p) flag has been deprecated";

/// A single JSON value decoded from one line of the child's stdout.
struct Event {
  std::string raw;
  common::JsonKind kind = common::JsonKind::Null;
  /// Top-level members; empty unless kind is Object.
  common::JsonObject fields;
};

/// Strictly decodes one trimmed stdout line. nullopt when the line is not a
/// complete JSON value.
[[nodiscard]] std::optional<Event> decode_event(const std::string &line);

/// Folds one event into the aggregated result. Never fails: members that are
/// missing or of an unexpected kind are skipped.
void apply_event(const Event &event, GeminiResult &state, bool capture_all);

} // namespace gembridge::gemini
