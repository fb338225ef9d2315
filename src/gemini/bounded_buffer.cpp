#include "gembridge/gemini/bounded_buffer.hpp"

#include <algorithm>

namespace gembridge::gemini {

void BoundedText::append_line(const std::string &line, const bool cut) {
  if (truncated_ || text_.size() >= max_bytes_) {
    return;
  }
  if (!text_.empty()) {
    text_.push_back('\n');
  }
  const std::size_t remaining = max_bytes_ > text_.size() ? max_bytes_ - text_.size() : 0;
  if (line.size() <= remaining && !cut) {
    text_ += line;
    return;
  }
  text_.append(line, 0, std::min(line.size(), remaining));
  text_ += TRUNCATION_MARKER;
  truncated_ = true;
}

void BoundedLines::push(std::string line) {
  if (lines_.size() >= max_entries_) {
    ++dropped_;
    return;
  }
  lines_.push_back(std::move(line));
}

} // namespace gembridge::gemini
