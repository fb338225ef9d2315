#include "gembridge/gemini/supervisor.hpp"

#include "gembridge/common/fs.hpp"
#include "gembridge/gemini/bounded_buffer.hpp"
#include "gembridge/gemini/event_interpreter.hpp"
#include "gembridge/gemini/line_reader.hpp"
#include "gembridge/gemini/process.hpp"
#include "gembridge/gemini/validator.hpp"
#include "gembridge/observability/global.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>

namespace gembridge::gemini {

namespace {

struct DrainState {
  GeminiResult result;
  BoundedText stderr_text{MAX_STDERR_BYTES};
  BoundedLines non_json{MAX_NON_JSON_LINES};
  bool valid_json_seen = false;
};

void handle_stdout_line(const std::string &line, DrainState &state, const bool capture_all) {
  const std::string trimmed = common::trim(line);
  if (trimmed.empty()) {
    return;
  }
  auto event = decode_event(trimmed);
  if (!event.has_value()) {
    state.non_json.push(trimmed);
    return;
  }
  state.valid_json_seen = true;
  apply_event(*event, state.result, capture_all);
}

common::Result<GeminiResult> timed_out(ChildProcess &child, const Deadline &deadline) {
  child.kill();
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(deadline.budget());
  observability::record_timeout(secs);
  return common::Result<GeminiResult>::failure(
      "Gemini command timed out after " + std::to_string(secs.count()) + " seconds",
      common::ErrorCode::Timeout);
}

/// Children normally exit right after closing their output, so the reap is
/// polled in short steps rather than blocking past the deadline.
common::Result<ExitStatus> reap(ChildProcess &child, const Deadline &deadline) {
  constexpr int REAP_POLL_MS = 10;
  while (true) {
    auto status = child.try_wait();
    if (!status.ok()) {
      return common::Result<ExitStatus>::failure(status.error(), status.code());
    }
    if (status.value().has_value()) {
      return common::Result<ExitStatus>::success(*status.value());
    }
    if (deadline.expired()) {
      return common::Result<ExitStatus>::failure("deadline expired", common::ErrorCode::Timeout);
    }
    (void)poll(nullptr, 0, std::min(REAP_POLL_MS, deadline.remaining_ms()));
  }
}

void compose_exit_outcome(const ExitStatus &status, DrainState &state) {
  GeminiResult &result = state.result;
  if (!status.success()) {
    result.mark_failed();
    std::string message =
        result.error.has_value() ? *result.error : "gemini command failed with " + status.describe();
    if (!state.stderr_text.empty()) {
      message += "\nStderr: " + state.stderr_text.text();
    }
    if (!state.non_json.empty()) {
      message += "\nNon-JSON output: " + common::join(state.non_json.lines(), "\n");
    }
    result.error = std::move(message);
    return;
  }

  if (!state.valid_json_seen) {
    result.mark_failed();
    std::string message =
        "gemini command exited successfully but produced no valid structured output";
    if (!state.non_json.empty()) {
      message += "\nOutput: " + common::join(state.non_json.lines(), "\n");
    }
    result.error = std::move(message);
  }
}

} // namespace

common::Result<GeminiResult> Supervisor::run(const std::vector<std::string> &argv,
                                             const bool capture_all,
                                             const Deadline &deadline) const {
  auto spawned = ChildProcess::spawn(argv);
  if (!spawned.ok()) {
    return common::Result<GeminiResult>::failure(spawned.error(), spawned.code());
  }
  ChildProcess child = std::move(spawned.value());

  DrainState state;
  state.result.return_all_messages = capture_all;

  LineReader stdout_reader(child.stdout_fd());
  // Stderr is kept only up to MAX_STDERR_BYTES, so no longer line is worth buffering.
  LineReader stderr_reader(child.stderr_fd(), MAX_STDERR_BYTES);
  bool stdout_open = true;
  bool stderr_open = true;

  while (stdout_open || stderr_open) {
    if (deadline.expired()) {
      return timed_out(child, deadline);
    }

    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    int stdout_slot = -1;
    int stderr_slot = -1;
    if (stdout_open) {
      stdout_slot = static_cast<int>(count);
      fds[count++] = pollfd{.fd = stdout_reader.fd(), .events = POLLIN, .revents = 0};
    }
    if (stderr_open) {
      stderr_slot = static_cast<int>(count);
      fds[count++] = pollfd{.fd = stderr_reader.fd(), .events = POLLIN, .revents = 0};
    }

    const int ready = poll(fds.data(), count, deadline.remaining_ms());
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string reason = std::strerror(errno);
      child.kill();
      return common::Result<GeminiResult>::failure("Failed to poll gemini output: " + reason,
                                                   common::ErrorCode::Stream);
    }
    if (ready == 0) {
      continue;
    }

    const short ready_mask = POLLIN | POLLHUP | POLLERR;
    if (stdout_slot >= 0 && (fds[static_cast<std::size_t>(stdout_slot)].revents & ready_mask)) {
      auto batch = stdout_reader.read_available();
      if (!batch.ok()) {
        child.kill();
        return common::Result<GeminiResult>::failure(
            "Failed to read from stdout: " + batch.error(), common::ErrorCode::Stream);
      }
      if (batch.value().truncated > 0) {
        observability::record_warning(
            "supervisor", "stdout line exceeded " + std::to_string(DEFAULT_MAX_LINE_BYTES) +
                              " bytes and was cut");
      }
      for (const auto &line : batch.value().lines) {
        handle_stdout_line(line, state, capture_all);
      }
      stdout_open = !batch.value().eof;
    }

    if (stderr_slot >= 0 && (fds[static_cast<std::size_t>(stderr_slot)].revents & ready_mask)) {
      auto batch = stderr_reader.read_available();
      if (!batch.ok()) {
        observability::record_warning("supervisor",
                                      "Failed to read from stderr: " + batch.error());
        stderr_open = false;
      } else {
        for (const auto &line : batch.value().lines) {
          // The reader stops at MAX_STDERR_BYTES, so a line of that length was cut.
          state.stderr_text.append_line(line, line.size() >= MAX_STDERR_BYTES);
        }
        stderr_open = !batch.value().eof;
      }
    }
  }

  auto status = reap(child, deadline);
  if (!status.ok()) {
    if (status.code() == common::ErrorCode::Timeout) {
      return timed_out(child, deadline);
    }
    child.kill();
    return common::Result<GeminiResult>::failure(status.error(), status.code());
  }

  if (!state.non_json.empty()) {
    observability::record_metric(
        observability::NonJsonLinesMetric{.count = state.non_json.lines().size() +
                                                   state.non_json.dropped()});
  }
  if (capture_all) {
    observability::record_metric(
        observability::CapturedEventsMetric{.count = state.result.all_messages.size()});
  }

  compose_exit_outcome(status.value(), state);
  return common::Result<GeminiResult>::success(finalize(std::move(state.result)));
}

} // namespace gembridge::gemini
