/**
 * @file process.hpp
 * @brief RAII handle for a shell child process and its descendants
 *
 * @details ScopedProcess owns one `/bin/sh -c` child:
 *
 *          - The child leads a new process group, so the whole tree it
 *            starts can be signalled at once
 *
 *          - stdout and stderr are captured through separate pipes,
 *            byte for byte
 *
 *          - stdin is /dev/null
 *
 *          - Destroying a handle whose child still runs kills the group
 *            and reaps the child
 *
 * @note Descendants that call setsid() leave the group and are out of
 *       reach of terminate_group().
 */

#ifndef FFMPEG_MCP_PROCESS_HPP
#define FFMPEG_MCP_PROCESS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include <sys/types.h>

namespace ffmpeg_mcp {

/**
 * @class ScopedProcess
 * @brief Move-only owner of a spawned shell command.
 */
class ScopedProcess {
public:
  using Clock = std::chrono::steady_clock;

  /// Result of wait_until()
  enum class WaitState {
    Exited,   //< Child exited; exit_code() is valid
    TimedOut, //< Deadline passed; group killed and child reaped
    Failed    //< I/O error while waiting; see error()
  };

  ScopedProcess() = default;
  ~ScopedProcess();

  /// Disable copy
  ScopedProcess(const ScopedProcess &) = delete;
  ScopedProcess &operator=(const ScopedProcess &) = delete;

  /// Enable move
  ScopedProcess(ScopedProcess &&other) noexcept;
  ScopedProcess &operator=(ScopedProcess &&other) noexcept;

  /**
   * @brief Start `/bin/sh -c command` inside working_dir.
   *
   * @note Failures of the child before exec (chdir, exec) are reported
   *       here through a close-on-exec status pipe, not as exit code 127.
   *
   * @return true if the shell is running, false with error() set otherwise
   */
  bool spawn(const std::string &command, const std::string &working_dir);

  /**
   * @brief Capture output until the child exits or the deadline passes.
   *
   * @note When the child exits first, every process still left in its
   *       group is killed and the pipes are drained to EOF before
   *       returning. On timeout the group is killed and the child reaped.
   *
   * @param deadline Absolute deadline (nullopt = wait forever)
   */
  WaitState wait_until(std::optional<Clock::time_point> deadline);

  /**
   * @brief Send SIGKILL to every process in the child's group.
   * @return true if the signal was delivered to at least one process
   */
  bool terminate_group();

  /// Exit status; 128 + signal number if the child was killed by a signal
  int exit_code() const;

  pid_t pid() const { return pid_; }
  bool running() const { return pid_ > 0 && !reaped_; }
  const std::string &error() const { return error_; }

  std::string take_stdout() { return std::move(stdout_buf_); }
  std::string take_stderr() { return std::move(stderr_buf_); }

private:
  pid_t pid_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  bool reaped_ = false;
  bool status_valid_ = false; //< raw_status_ came from a successful waitpid
  int raw_status_ = 0;
  std::string stdout_buf_;
  std::string stderr_buf_;
  std::string error_;

  /// Poll both pipes for up to timeout_ms; false on poll failure
  bool pump_output(int timeout_ms);
  /// Read everything currently available from fd into buf
  void read_available(int &fd, std::string &buf);
  /// Drain pipes until EOF or the grace period ends
  void drain_after_exit();
  /// True once the child has exited (the zombie is kept, not reaped)
  bool child_exited();
  void reap();
  void close_pipes();
  void release() noexcept;
};

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_PROCESS_HPP
