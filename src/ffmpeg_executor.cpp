/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "ffmpeg_mcp/ffmpeg_executor.hpp"

#include <chrono>
#include <exception>

#include <fmt/core.h>

#include "ffmpeg_mcp/logging.hpp"
#include "ffmpeg_mcp/process.hpp"

namespace ffmpeg_mcp {

namespace {

ExecutionResult run_process(const std::string &command,
                            const std::string &working_dir,
                            std::optional<int> timeout_seconds) {
  ScopedProcess process;
  if (!process.spawn(command, working_dir)) {
    return ExecutionResult::faulted(process.error());
  }

  std::optional<ScopedProcess::Clock::time_point> deadline;
  if (timeout_seconds) {
    deadline = ScopedProcess::Clock::now() +
               std::chrono::seconds(*timeout_seconds);
  }

  switch (process.wait_until(deadline)) {
  case ScopedProcess::WaitState::TimedOut:
    return ExecutionResult::timed_out(*timeout_seconds);
  case ScopedProcess::WaitState::Failed:
    return ExecutionResult::faulted(process.error());
  case ScopedProcess::WaitState::Exited:
    break;
  }

  int code = process.exit_code();
  if (code < 0) {
    return ExecutionResult::faulted(
        fmt::format("could not collect exit status of pid {}", process.pid()));
  }
  return ExecutionResult::completed(code, process.take_stdout(),
                                    process.take_stderr());
}

} // anonymous namespace

ExecutionResult execute_ffmpeg_command(const std::string &command,
                                       const std::string &working_dir,
                                       std::optional<int> timeout_seconds) {
  LOG_INFO("Executing FFmpeg command: {}", abbreviate(command));
  LOG_INFO("Working directory: {}", working_dir);
  if (timeout_seconds) {
    LOG_INFO("Timeout: {}s", *timeout_seconds);
  } else {
    LOG_INFO("Timeout: unlimited");
  }

  auto start = std::chrono::steady_clock::now();

  ExecutionResult result;
  try {
    result = run_process(command, working_dir, timeout_seconds);
  } catch (const std::exception &e) {
    /// e.g. std::bad_alloc while buffering a huge output
    result = ExecutionResult::faulted(e.what());
  }

  long ms = elapsed_ms(start);
  switch (result.status) {
  case ExecutionStatus::Completed:
    if (result.succeeded) {
      LOG_SUCCESS("Command executed successfully ({} ms)", ms);
    } else {
      LOG_WARN("Command failed with exit code {} ({} ms)", result.exit_code,
               ms);
    }
    break;
  case ExecutionStatus::TimedOut:
  case ExecutionStatus::Faulted:
    LOG_ERROR("{} ({} ms)", result.error_message.value_or(""), ms);
    break;
  }

  return result;
}

} // namespace ffmpeg_mcp
