#pragma once

#include "gembridge/common/result.hpp"

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace gembridge::gemini {

struct ExitStatus {
  bool exited = false;
  int code = 0;
  int signal = 0;

  [[nodiscard]] bool success() const { return exited && code == 0; }
  [[nodiscard]] std::string describe() const;
};

/// A spawned child with stdin on /dev/null and stdout/stderr on non-blocking
/// pipes. The child leads its own process group so that killing it also takes
/// down anything it started. A child that is still running when the handle is
/// destroyed is killed and reaped.
class ChildProcess {
public:
  /// argv[0] is resolved through PATH; arguments are passed verbatim, never
  /// through a shell. Fails with ErrorCode::Spawn when exec fails.
  [[nodiscard]] static common::Result<ChildProcess> spawn(const std::vector<std::string> &argv);

  ChildProcess(ChildProcess &&other) noexcept;
  ChildProcess &operator=(ChildProcess &&other) noexcept;
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;
  ~ChildProcess();

  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] int stdout_fd() const { return stdout_fd_; }
  [[nodiscard]] int stderr_fd() const { return stderr_fd_; }
  [[nodiscard]] bool reaped() const { return reaped_; }

  /// Blocks until the child exits.
  [[nodiscard]] common::Result<ExitStatus> wait();

  /// Reaps the child if it has already exited; nullopt while it is running.
  [[nodiscard]] common::Result<std::optional<ExitStatus>> try_wait();

  /// SIGKILL to the child's process group, then waits for the child. Safe to
  /// call more than once.
  void kill();

private:
  ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);
  void close_pipes();

  pid_t pid_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  bool reaped_ = true;
};

} // namespace gembridge::gemini
