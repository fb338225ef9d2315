#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gembridge::gemini {

constexpr std::int64_t MIN_TIMEOUT_SECS = 1;
constexpr std::int64_t MAX_TIMEOUT_SECS = 3600;
constexpr std::int64_t DEFAULT_TIMEOUT_SECS = 600;

[[nodiscard]] constexpr bool timeout_in_range(const std::int64_t secs) {
  return secs >= MIN_TIMEOUT_SECS && secs <= MAX_TIMEOUT_SECS;
}

/// Process-wide default from an optional override string (typically the
/// GEMINI_DEFAULT_TIMEOUT variable). Anything unparsable or outside the
/// allowed range falls back to DEFAULT_TIMEOUT_SECS.
[[nodiscard]] std::chrono::seconds
resolve_default_timeout(const std::optional<std::string> &override_value);

/// Per-request timeout if given, else the configured default.
[[nodiscard]] std::chrono::seconds resolve_timeout(std::optional<std::int64_t> request_secs,
                                                   std::chrono::seconds fallback);

/// Wall-clock budget for one invocation, measured on the steady clock.
class Deadline {
public:
  using Clock = std::chrono::steady_clock;

  explicit Deadline(std::chrono::milliseconds budget);
  static Deadline after(std::chrono::seconds budget);

  [[nodiscard]] bool expired() const;
  /// Milliseconds left, clamped to [0, INT_MAX] so it can be handed to poll().
  [[nodiscard]] int remaining_ms() const;
  [[nodiscard]] std::chrono::milliseconds budget() const { return budget_; }
  [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
  Clock::time_point started_;
  Clock::time_point expires_at_;
  std::chrono::milliseconds budget_;
};

} // namespace gembridge::gemini
