#include "gembridge/gemini/deadline.hpp"

#include "gembridge/common/fs.hpp"

#include <charconv>
#include <climits>

namespace gembridge::gemini {

std::chrono::seconds resolve_default_timeout(const std::optional<std::string> &override_value) {
  if (!override_value.has_value()) {
    return std::chrono::seconds(DEFAULT_TIMEOUT_SECS);
  }
  const std::string normalized = common::trim(*override_value);
  std::int64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (normalized.empty() || ec != std::errc() || ptr != last || !timeout_in_range(parsed)) {
    return std::chrono::seconds(DEFAULT_TIMEOUT_SECS);
  }
  return std::chrono::seconds(parsed);
}

std::chrono::seconds resolve_timeout(const std::optional<std::int64_t> request_secs,
                                     const std::chrono::seconds fallback) {
  if (request_secs.has_value()) {
    return std::chrono::seconds(*request_secs);
  }
  return fallback;
}

Deadline::Deadline(const std::chrono::milliseconds budget)
    : started_(Clock::now()), expires_at_(started_ + budget), budget_(budget) {}

Deadline Deadline::after(const std::chrono::seconds budget) {
  return Deadline(std::chrono::duration_cast<std::chrono::milliseconds>(budget));
}

bool Deadline::expired() const { return Clock::now() >= expires_at_; }

int Deadline::remaining_ms() const {
  const auto left =
      std::chrono::duration_cast<std::chrono::milliseconds>(expires_at_ - Clock::now()).count();
  if (left <= 0) {
    return 0;
  }
  if (left > INT_MAX) {
    return INT_MAX;
  }
  return static_cast<int>(left);
}

std::chrono::milliseconds Deadline::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
}

} // namespace gembridge::gemini
