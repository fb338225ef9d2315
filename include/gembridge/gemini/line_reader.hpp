#pragma once

#include "gembridge/common/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gembridge::gemini {

constexpr std::size_t DEFAULT_MAX_LINE_BYTES = 8 * 1024 * 1024;

struct ReadBatch {
  std::vector<std::string> lines;
  // Lines in `lines` that were cut at the length limit.
  std::size_t truncated = 0;
  bool eof = false;
};

/// Splits a non-blocking file descriptor into newline-terminated lines.
/// The descriptor is borrowed, not owned. At most max_line_bytes of a line are
/// buffered; the rest of an overlong line is discarded up to its newline.
class LineReader {
public:
  explicit LineReader(int fd, std::size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES,
                      std::size_t chunk_size = 4096);

  /// One read() worth of complete lines, with "\n" (and a preceding "\r")
  /// stripped. An unterminated fragment left at EOF is dropped.
  [[nodiscard]] common::Result<ReadBatch> read_available();

  [[nodiscard]] int fd() const { return fd_; }
  [[nodiscard]] bool eof() const { return eof_; }
  /// Bytes of the current unterminated line held in memory.
  [[nodiscard]] std::size_t buffered() const { return partial_.size(); }

private:
  void append_capped(const char *data, std::size_t size);

  int fd_;
  std::size_t max_line_bytes_;
  std::size_t chunk_size_;
  std::string partial_;
  bool overflowed_ = false;
  bool eof_ = false;
};

} // namespace gembridge::gemini
