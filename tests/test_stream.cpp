#include "test_framework.hpp"

#include "gembridge/gemini/bounded_buffer.hpp"
#include "gembridge/gemini/line_reader.hpp"
#include "gembridge/gemini/types.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace {

struct PipePair {
  int read_fd = -1;
  int write_fd = -1;

  PipePair() {
    int fds[2] = {-1, -1};
    gembridge::tests::require(pipe(fds) == 0, "pipe() failed");
    read_fd = fds[0];
    write_fd = fds[1];
  }

  ~PipePair() {
    close_write();
    if (read_fd >= 0) {
      ::close(read_fd);
    }
  }

  void write(const std::string &data) const {
    gembridge::tests::require(::write(write_fd, data.data(), data.size()) ==
                                  static_cast<ssize_t>(data.size()),
                              "short write");
  }

  void close_write() {
    if (write_fd >= 0) {
      ::close(write_fd);
      write_fd = -1;
    }
  }
};

} // namespace

void register_stream_tests(std::vector<gembridge::tests::TestCase> &tests) {
  using gembridge::tests::require;
  namespace gemini = gembridge::gemini;

  tests.push_back({"line_reader_splits_and_strips_terminators", [] {
                     PipePair pipe_pair;
                     gemini::LineReader reader(pipe_pair.read_fd);
                     pipe_pair.write("one\ntwo\r\n\nthr");

                     const auto first = reader.read_available();
                     require(first.ok(), first.error());
                     require(first.value().lines.size() == 3, "three complete lines");
                     require(first.value().lines[0] == "one", "first line");
                     require(first.value().lines[1] == "two", "CRLF stripped");
                     require(first.value().lines[2].empty(), "empty line kept");
                     require(!first.value().eof, "not at eof");

                     pipe_pair.write("ee\n");
                     const auto second = reader.read_available();
                     require(second.ok(), second.error());
                     require(second.value().lines.size() == 1 &&
                                 second.value().lines[0] == "three",
                             "partial line joined across reads");
                   }});

  tests.push_back({"line_reader_drops_unterminated_tail_at_eof", [] {
                     PipePair pipe_pair;
                     gemini::LineReader reader(pipe_pair.read_fd);
                     pipe_pair.write("done\n{\"partial\":");
                     pipe_pair.close_write();

                     std::vector<std::string> lines;
                     bool eof = false;
                     while (!eof) {
                       auto batch = reader.read_available();
                       require(batch.ok(), batch.error());
                       for (auto &line : batch.value().lines) {
                         lines.push_back(line);
                       }
                       eof = batch.value().eof;
                     }
                     require(lines.size() == 1 && lines[0] == "done",
                             "only the terminated line is emitted");
                     require(reader.eof(), "reader should report eof");

                     const auto after = reader.read_available();
                     require(after.ok() && after.value().eof && after.value().lines.empty(),
                             "reads after eof stay at eof");
                   }});

  tests.push_back({"line_reader_small_chunks_reassemble_lines", [] {
                     PipePair pipe_pair;
                     gemini::LineReader reader(pipe_pair.read_fd, gemini::DEFAULT_MAX_LINE_BYTES, 3);
                     pipe_pair.write("abcdefgh\nij\n");
                     pipe_pair.close_write();

                     std::vector<std::string> lines;
                     for (int i = 0; i < 16 && !reader.eof(); ++i) {
                       auto batch = reader.read_available();
                       require(batch.ok(), batch.error());
                       lines.insert(lines.end(), batch.value().lines.begin(),
                                    batch.value().lines.end());
                     }
                     require(lines.size() == 2, "two lines expected");
                     require(lines[0] == "abcdefgh" && lines[1] == "ij", "content mismatch");
                   }});

  tests.push_back({"line_reader_cuts_overlong_lines_at_limit", [] {
                     PipePair pipe_pair;
                     require(fcntl(pipe_pair.read_fd, F_SETFL, O_NONBLOCK) == 0, "fcntl");
                     gemini::LineReader reader(pipe_pair.read_fd, 4, 3);
                     pipe_pair.write("abcdefgh\nij\r\nwxyz\r\n" + std::string(5000, 'x'));

                     std::vector<std::string> lines;
                     std::size_t truncated = 0;
                     for (int i = 0; i < 4096; ++i) {
                       auto batch = reader.read_available();
                       require(batch.ok(), batch.error());
                       lines.insert(lines.end(), batch.value().lines.begin(),
                                    batch.value().lines.end());
                       truncated += batch.value().truncated;
                       require(reader.buffered() <= 4, "buffer stays within the limit");
                     }
                     require(lines.size() == 3, "three lines expected");
                     require(lines[0] == "abcd", "first line cut at limit");
                     require(lines[1] == "ij", "short line intact");
                     require(lines[2] == "wxyz", "line of exactly the limit keeps its content");
                     require(truncated == 2, "two lines reported as cut");

                     pipe_pair.write("tail\nok\n");
                     pipe_pair.close_write();
                     lines.clear();
                     for (int i = 0; i < 16 && !reader.eof(); ++i) {
                       auto batch = reader.read_available();
                       require(batch.ok(), batch.error());
                       lines.insert(lines.end(), batch.value().lines.begin(),
                                    batch.value().lines.end());
                     }
                     require(lines.size() == 2 && lines[0] == "xxxx" && lines[1] == "ok",
                             "overlong fragment discarded up to its newline");
                   }});

  tests.push_back({"line_reader_would_block_yields_empty_batch", [] {
                     PipePair pipe_pair;
                     require(fcntl(pipe_pair.read_fd, F_SETFL, O_NONBLOCK) == 0, "fcntl");
                     gemini::LineReader reader(pipe_pair.read_fd);
                     const auto batch = reader.read_available();
                     require(batch.ok(), batch.error());
                     require(batch.value().lines.empty() && !batch.value().eof,
                             "no data is not eof");
                   }});

  tests.push_back({"line_reader_reports_read_errors", [] {
                     gemini::LineReader reader(-1);
                     const auto batch = reader.read_available();
                     require(!batch.ok(), "bad descriptor should fail");
                     require(batch.code() == gembridge::common::ErrorCode::Stream,
                             "stream error code");
                   }});

  tests.push_back({"bounded_text_joins_lines", [] {
                     gemini::BoundedText text(100);
                     text.append_line("warning: one");
                     text.append_line("warning: two");
                     require(text.text() == "warning: one\nwarning: two", "joined with newline");
                     require(!text.truncated(), "not truncated");
                   }});

  tests.push_back({"bounded_text_truncates_once_at_cap", [] {
                     gemini::BoundedText text(10);
                     text.append_line("12345");
                     text.append_line("abcdefgh");
                     text.append_line("never stored");
                     require(text.truncated(), "should be truncated");
                     require(text.text() == std::string("12345\nabcd") +
                                                gemini::BoundedText::TRUNCATION_MARKER,
                             "got: " + text.text());
                   }});

  tests.push_back({"bounded_text_respects_stderr_budget", [] {
                     gemini::BoundedText text(gemini::MAX_STDERR_BYTES);
                     const std::string line(1000, 'x');
                     for (int i = 0; i < 200; ++i) {
                       text.append_line(line);
                     }
                     const std::string marker = gemini::BoundedText::TRUNCATION_MARKER;
                     require(text.text().size() == gemini::MAX_STDERR_BYTES + marker.size(),
                             "size should be cap plus marker");
                     require(text.text().ends_with(marker), "marker at the end");
                   }});

  tests.push_back({"bounded_lines_counts_dropped_entries", [] {
                     gemini::BoundedLines lines(2);
                     lines.push("a");
                     lines.push("b");
                     lines.push("c");
                     require(lines.lines().size() == 2, "capped");
                     require(lines.lines()[1] == "b", "first entries kept");
                     require(lines.dropped() == 1, "dropped count");
                   }});
}
