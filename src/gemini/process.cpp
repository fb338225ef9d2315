#include "gembridge/gemini/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace gembridge::gemini {

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Pipe creation and fork are serialized so that a pipe made by one thread is
// marked close-on-exec before another thread forks.
std::mutex g_spawn_mutex;

bool set_cloexec(const int fd) {
  const int flags = fcntl(fd, F_GETFD, 0);
  return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

bool make_pipe(std::array<int, 2> &fds) {
  if (pipe(fds.data()) != 0) {
    return false;
  }
  return set_cloexec(fds[0]) && set_cloexec(fds[1]);
}

bool set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

ExitStatus decode_wait_status(const int status) {
  ExitStatus exit;
  if (WIFEXITED(status)) {
    exit.exited = true;
    exit.code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit.signal = WTERMSIG(status);
  }
  return exit;
}

[[noreturn]] void exec_child(char *const *argv, const int out_fd, const int err_fd,
                             const int status_fd) {
  (void)setpgid(0, 0);
  std::signal(SIGPIPE, SIG_DFL);

  const int null_fd = ::open("/dev/null", O_RDONLY);
  if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0 || dup2(out_fd, STDOUT_FILENO) < 0 ||
      dup2(err_fd, STDERR_FILENO) < 0) {
    const int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    _exit(127);
  }

  execvp(argv[0], argv);
  const int err = errno;
  (void)!::write(status_fd, &err, sizeof(err));
  _exit(127);
}

} // namespace

std::string ExitStatus::describe() const {
  if (exited) {
    return "exit code: " + std::to_string(code);
  }
  if (signal != 0) {
    return "signal: " + std::to_string(signal);
  }
  return "unknown status";
}

ChildProcess::ChildProcess(const pid_t pid, const int stdout_fd, const int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd), reaped_(false) {}

ChildProcess::ChildProcess(ChildProcess &&other) noexcept
    : pid_(std::exchange(other.pid_, -1)), stdout_fd_(std::exchange(other.stdout_fd_, -1)),
      stderr_fd_(std::exchange(other.stderr_fd_, -1)),
      reaped_(std::exchange(other.reaped_, true)) {}

ChildProcess &ChildProcess::operator=(ChildProcess &&other) noexcept {
  if (this != &other) {
    kill();
    close_pipes();
    pid_ = std::exchange(other.pid_, -1);
    stdout_fd_ = std::exchange(other.stdout_fd_, -1);
    stderr_fd_ = std::exchange(other.stderr_fd_, -1);
    reaped_ = std::exchange(other.reaped_, true);
  }
  return *this;
}

ChildProcess::~ChildProcess() {
  kill();
  close_pipes();
}

common::Result<ChildProcess> ChildProcess::spawn(const std::vector<std::string> &argv) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<ChildProcess>::failure("Failed to spawn gemini command: empty command",
                                                 common::ErrorCode::Spawn);
  }

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  std::array<int, 2> out_pipe{-1, -1};
  std::array<int, 2> err_pipe{-1, -1};
  std::array<int, 2> status_pipe{-1, -1};
  auto close_all = [&]() {
    for (auto *p : {&out_pipe, &err_pipe, &status_pipe}) {
      close_fd((*p)[0]);
      close_fd((*p)[1]);
    }
  };

  std::unique_lock<std::mutex> spawn_lock(g_spawn_mutex);
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(status_pipe)) {
    const std::string reason = std::strerror(errno);
    close_all();
    return common::Result<ChildProcess>::failure("Failed to create pipes: " + reason,
                                                 common::ErrorCode::Spawn);
  }

  const pid_t pid = fork();
  if (pid != 0) {
    spawn_lock.unlock();
  }
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    close_all();
    return common::Result<ChildProcess>::failure("Failed to fork: " + reason,
                                                 common::ErrorCode::Spawn);
  }

  if (pid == 0) {
    exec_child(c_argv.data(), out_pipe[1], err_pipe[1], status_pipe[1]);
  }

  (void)setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  // The status pipe closes on a successful exec; otherwise it carries errno.
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (got > 0) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_all();
    return common::Result<ChildProcess>::failure("Failed to spawn gemini command '" +
                                                     argv.front() +
                                                     "': " + std::strerror(child_errno),
                                                 common::ErrorCode::Spawn);
  }

  ChildProcess child(pid, out_pipe[0], err_pipe[0]);
  if (!set_non_blocking(child.stdout_fd_) || !set_non_blocking(child.stderr_fd_)) {
    return common::Result<ChildProcess>::failure("Failed to configure child pipes",
                                                 common::ErrorCode::Spawn);
  }
  return common::Result<ChildProcess>::success(std::move(child));
}

common::Result<ExitStatus> ChildProcess::wait() {
  if (reaped_) {
    return common::Result<ExitStatus>::failure("child process already reaped",
                                               common::ErrorCode::Stream);
  }
  int status = 0;
  pid_t done = -1;
  do {
    done = waitpid(pid_, &status, 0);
  } while (done < 0 && errno == EINTR);
  if (done != pid_) {
    return common::Result<ExitStatus>::failure(
        std::string("Failed to wait for gemini command: ") + std::strerror(errno),
        common::ErrorCode::Stream);
  }
  reaped_ = true;
  return common::Result<ExitStatus>::success(decode_wait_status(status));
}

common::Result<std::optional<ExitStatus>> ChildProcess::try_wait() {
  if (reaped_) {
    return common::Result<std::optional<ExitStatus>>::failure("child process already reaped",
                                                              common::ErrorCode::Stream);
  }
  int status = 0;
  pid_t done = -1;
  do {
    done = waitpid(pid_, &status, WNOHANG);
  } while (done < 0 && errno == EINTR);
  if (done < 0) {
    return common::Result<std::optional<ExitStatus>>::failure(
        std::string("Failed to wait for gemini command: ") + std::strerror(errno),
        common::ErrorCode::Stream);
  }
  if (done == 0) {
    return common::Result<std::optional<ExitStatus>>::success(std::nullopt);
  }
  reaped_ = true;
  return common::Result<std::optional<ExitStatus>>::success(decode_wait_status(status));
}

void ChildProcess::kill() {
  if (reaped_ || pid_ <= 0) {
    return;
  }
  if (::kill(-pid_, SIGKILL) != 0) {
    (void)::kill(pid_, SIGKILL);
  }
  if (!wait().ok()) {
    reaped_ = true;
  }
}

void ChildProcess::close_pipes() {
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

} // namespace gembridge::gemini
