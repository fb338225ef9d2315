#include "gembridge/gemini/line_reader.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace gembridge::gemini {

LineReader::LineReader(const int fd, const std::size_t max_line_bytes,
                       const std::size_t chunk_size)
    : fd_(fd), max_line_bytes_(max_line_bytes == 0 ? DEFAULT_MAX_LINE_BYTES : max_line_bytes),
      chunk_size_(chunk_size == 0 ? 4096 : chunk_size) {}

void LineReader::append_capped(const char *data, const std::size_t size) {
  const std::size_t room =
      max_line_bytes_ > partial_.size() ? max_line_bytes_ - partial_.size() : 0;
  if (size > room) {
    overflowed_ = true;
  }
  partial_.append(data, std::min(size, room));
}

common::Result<ReadBatch> LineReader::read_available() {
  ReadBatch batch;
  if (eof_) {
    batch.eof = true;
    return common::Result<ReadBatch>::success(std::move(batch));
  }

  std::string buffer(chunk_size_, '\0');
  const ssize_t bytes = ::read(fd_, buffer.data(), buffer.size());
  if (bytes < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return common::Result<ReadBatch>::success(std::move(batch));
    }
    return common::Result<ReadBatch>::failure(std::string("read failed: ") + std::strerror(errno),
                                              common::ErrorCode::Stream);
  }
  if (bytes == 0) {
    eof_ = true;
    partial_.clear();
    overflowed_ = false;
    batch.eof = true;
    return common::Result<ReadBatch>::success(std::move(batch));
  }

  const std::size_t size = static_cast<std::size_t>(bytes);
  std::size_t start = 0;
  while (start < size) {
    const auto *newline =
        static_cast<const char *>(std::memchr(buffer.data() + start, '\n', size - start));
    if (newline == nullptr) {
      append_capped(buffer.data() + start, size - start);
      break;
    }
    const std::size_t end = static_cast<std::size_t>(newline - buffer.data());
    append_capped(buffer.data() + start, end - start);
    if (!overflowed_ && !partial_.empty() && partial_.back() == '\r') {
      partial_.pop_back();
    }
    if (overflowed_) {
      ++batch.truncated;
    }
    batch.lines.push_back(std::move(partial_));
    partial_.clear();
    overflowed_ = false;
    start = end + 1;
  }
  return common::Result<ReadBatch>::success(std::move(batch));
}

} // namespace gembridge::gemini
