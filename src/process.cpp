/**
 * @file process.cpp
 * @brief ScopedProcess implementation (fork/exec, pipes, process groups)
 *
 * @details Lifecycle:
 *
 *          1. spawn(): pipes, fork, child joins its own process group,
 *             chdir, exec /bin/sh. Pre-exec failures come back over a
 *             close-on-exec status pipe.
 *
 *          2. wait_until(): poll() the output pipes in short slices and
 *             check for exit with waitid(WNOWAIT), which leaves the zombie
 *             in place so the process group ID cannot be recycled before
 *             the group is killed.
 *
 *          3. Exit, timeout or destruction: kill(-pgid, SIGKILL), drain,
 *             reap.
 */

#include "ffmpeg_mcp/process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace ffmpeg_mcp {

namespace {

/// Poll slice while waiting; bounds how late an exit is noticed
constexpr int POLL_INTERVAL_MS = 50;

/// How long to keep reading after the group was killed
constexpr int DRAIN_GRACE_MS = 1000;

constexpr size_t READ_CHUNK = 64 * 1024;

/// Stage reported by a child that failed before exec
enum ChildStage : int { STAGE_CHDIR = 1, STAGE_EXEC = 2 };

std::string errno_message(int err) {
  return std::error_code(err, std::generic_category()).message();
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/// Child side: report stage + errno and exit. Async-signal-safe only.
[[noreturn]] void child_fail(int status_fd, int stage) {
  int msg[2] = {stage, errno};
  ssize_t ignored = ::write(status_fd, msg, sizeof(msg));
  (void)ignored;
  _exit(127);
}

} // anonymous namespace

// **----- Lifetime -----**

ScopedProcess::~ScopedProcess() { release(); }

ScopedProcess::ScopedProcess(ScopedProcess &&other) noexcept
    : pid_(other.pid_), stdout_fd_(other.stdout_fd_),
      stderr_fd_(other.stderr_fd_), reaped_(other.reaped_),
      status_valid_(other.status_valid_), raw_status_(other.raw_status_),
      stdout_buf_(std::move(other.stdout_buf_)),
      stderr_buf_(std::move(other.stderr_buf_)),
      error_(std::move(other.error_)) {
  other.pid_ = -1;
  other.stdout_fd_ = -1;
  other.stderr_fd_ = -1;
  other.reaped_ = false;
  other.status_valid_ = false;
}

ScopedProcess &ScopedProcess::operator=(ScopedProcess &&other) noexcept {
  if (this != &other) {
    release();
    pid_ = other.pid_;
    stdout_fd_ = other.stdout_fd_;
    stderr_fd_ = other.stderr_fd_;
    reaped_ = other.reaped_;
    status_valid_ = other.status_valid_;
    raw_status_ = other.raw_status_;
    stdout_buf_ = std::move(other.stdout_buf_);
    stderr_buf_ = std::move(other.stderr_buf_);
    error_ = std::move(other.error_);
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
    other.reaped_ = false;
    other.status_valid_ = false;
  }
  return *this;
}

void ScopedProcess::release() noexcept {
  if (running()) {
    terminate_group();
    reap();
  }
  close_pipes();
}

// **----- Spawn -----**

bool ScopedProcess::spawn(const std::string &command,
                          const std::string &working_dir) {
  if (pid_ > 0) {
    error_ = "process already spawned";
    return false;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};

  auto close_all = [&]() {
    for (int *p : {out_pipe, err_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };

  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(status_pipe, O_CLOEXEC) != 0) {
    error_ = fmt::format("Failed to create pipes: {}", errno_message(errno));
    close_all();
    return false;
  }

  /// Everything the child touches is prepared before fork
  const char *cmd = command.c_str();
  const char *dir = working_dir.c_str();
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  struct sigaction default_action {};
  default_action.sa_handler = SIG_DFL;
  sigemptyset(&default_action.sa_mask);

  pid_t pid = ::fork();
  if (pid < 0) {
    error_ = fmt::format("Failed to fork: {}", errno_message(errno));
    close_all();
    return false;
  }

  if (pid == 0) {
    // **---- CHILD ----**
    ::setpgid(0, 0);

    /// The server may block or ignore these; ffmpeg must not inherit that
    ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
    ::sigaction(SIGPIPE, &default_action, nullptr);
    ::sigaction(SIGINT, &default_action, nullptr);
    ::sigaction(SIGTERM, &default_action, nullptr);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    if (::dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
        ::dup2(err_pipe[1], STDERR_FILENO) < 0)
      child_fail(status_pipe[1], STAGE_EXEC);

    if (::chdir(dir) != 0)
      child_fail(status_pipe[1], STAGE_CHDIR);

    ::execl("/bin/sh", "sh", "-c", cmd, static_cast<char *>(nullptr));
    child_fail(status_pipe[1], STAGE_EXEC);
  }

  // **---- PARENT ----**
  /// Also set from the parent side so the group exists before we signal it
  ::setpgid(pid, pid);

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  pid_ = pid;
  reaped_ = false;
  status_valid_ = false;

  /// EOF here means exec succeeded (the pipe was close-on-exec)
  int msg[2] = {0, 0};
  ssize_t n;
  do {
    n = ::read(status_pipe[0], msg, sizeof(msg));
  } while (n < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(msg))) {
    if (msg[0] == STAGE_CHDIR) {
      error_ = fmt::format("Failed to change to working directory {}: {}",
                           working_dir, errno_message(msg[1]));
    } else {
      error_ = fmt::format("Failed to start /bin/sh: {}",
                           errno_message(msg[1]));
    }
    reap();
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    return false;
  }

  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  for (int fd : {stdout_fd_, stderr_fd_}) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
  return true;
}

// **----- Wait -----**

ScopedProcess::WaitState
ScopedProcess::wait_until(std::optional<Clock::time_point> deadline) {
  if (pid_ <= 0) {
    error_ = "process not spawned";
    return WaitState::Failed;
  }

  while (true) {
    if (child_exited()) {
      /// Background jobs left in the group would hold the pipes open
      terminate_group();
      drain_after_exit();
      reap();
      return WaitState::Exited;
    }

    int timeout_ms = POLL_INTERVAL_MS;
    if (deadline) {
      auto now = Clock::now();
      if (now >= *deadline) {
        terminate_group();
        reap();
        close_pipes();
        return WaitState::TimedOut;
      }
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                           *deadline - now)
                           .count();
      timeout_ms = static_cast<int>(
          std::max<long long>(1, std::min<long long>(timeout_ms, remaining)));
    }

    if (!pump_output(timeout_ms)) {
      terminate_group();
      reap();
      close_pipes();
      return WaitState::Failed;
    }
  }
}

bool ScopedProcess::terminate_group() {
  if (pid_ <= 0 || reaped_)
    return false;
  if (::kill(-pid_, SIGKILL) == 0)
    return true;
  /// Group not set up (should not happen); fall back to the child itself
  return ::kill(pid_, SIGKILL) == 0;
}

int ScopedProcess::exit_code() const {
  if (!reaped_ || !status_valid_)
    return -1;
  if (WIFEXITED(raw_status_))
    return WEXITSTATUS(raw_status_);
  if (WIFSIGNALED(raw_status_))
    return 128 + WTERMSIG(raw_status_);
  return -1;
}

// **----- Internals -----**

bool ScopedProcess::child_exited() {
  if (reaped_)
    return true;
  siginfo_t info{};
  int rc;
  do {
    rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info,
                  WEXITED | WNOHANG | WNOWAIT);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0)
    return true; //< ECHILD: nothing left to wait for
  return info.si_pid == pid_;
}

void ScopedProcess::reap() {
  if (pid_ <= 0 || reaped_)
    return;
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(pid_, &status, 0);
  } while (rc < 0 && errno == EINTR);
  reaped_ = true;
  status_valid_ = (rc == pid_);
  raw_status_ = status;
}

bool ScopedProcess::pump_output(int timeout_ms) {
  struct pollfd fds[2];
  nfds_t n = 0;
  if (stdout_fd_ >= 0)
    fds[n++] = {stdout_fd_, POLLIN, 0};
  if (stderr_fd_ >= 0)
    fds[n++] = {stderr_fd_, POLLIN, 0};

  int rc = ::poll(n ? fds : nullptr, n, timeout_ms);
  if (rc < 0) {
    if (errno == EINTR)
      return true;
    error_ = fmt::format("Failed to poll child output: {}",
                         errno_message(errno));
    return false;
  }

  for (nfds_t i = 0; i < n; ++i) {
    if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
      continue;
    if (fds[i].fd == stdout_fd_)
      read_available(stdout_fd_, stdout_buf_);
    else if (fds[i].fd == stderr_fd_)
      read_available(stderr_fd_, stderr_buf_);
  }
  return true;
}

void ScopedProcess::read_available(int &fd, std::string &buf) {
  char chunk[READ_CHUNK];
  while (fd >= 0) {
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n > 0) {
      buf.append(chunk, static_cast<size_t>(n));
    } else if (n == 0) {
      close_fd(fd);
    } else if (errno == EINTR) {
      continue;
    } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    } else {
      close_fd(fd);
    }
  }
}

void ScopedProcess::drain_after_exit() {
  auto give_up = Clock::now() + std::chrono::milliseconds(DRAIN_GRACE_MS);
  while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
    auto now = Clock::now();
    if (now >= give_up)
      break;
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(give_up - now)
            .count();
    if (!pump_output(static_cast<int>(std::max<long long>(1, remaining))))
      break;
  }
  close_pipes();
}

void ScopedProcess::close_pipes() {
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

} // namespace ffmpeg_mcp
