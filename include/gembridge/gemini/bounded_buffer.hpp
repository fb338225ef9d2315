#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gembridge::gemini {

/// Newline-joined text capped at a byte budget. The line that crosses the cap
/// is cut at the cap and followed by a single truncation marker; later lines
/// are discarded.
class BoundedText {
public:
  static constexpr const char *TRUNCATION_MARKER = "\n... (stderr truncated)";

  explicit BoundedText(std::size_t max_bytes) : max_bytes_(max_bytes) {}

  /// `cut` marks a line that was already shortened upstream; the marker is
  /// added even when the shortened line still fits.
  void append_line(const std::string &line, bool cut = false);

  [[nodiscard]] const std::string &text() const { return text_; }
  [[nodiscard]] bool empty() const { return text_.empty(); }
  [[nodiscard]] bool truncated() const { return truncated_; }

private:
  std::size_t max_bytes_;
  std::string text_;
  bool truncated_ = false;
};

/// Keeps the first max_entries lines and counts the rest.
class BoundedLines {
public:
  explicit BoundedLines(std::size_t max_entries) : max_entries_(max_entries) {}

  void push(std::string line);

  [[nodiscard]] const std::vector<std::string> &lines() const { return lines_; }
  [[nodiscard]] bool empty() const { return lines_.empty(); }
  [[nodiscard]] std::size_t dropped() const { return dropped_; }

private:
  std::size_t max_entries_;
  std::vector<std::string> lines_;
  std::size_t dropped_ = 0;
};

} // namespace gembridge::gemini
