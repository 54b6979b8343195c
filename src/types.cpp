/**
 * @file types.cpp
 * @brief ExecutionResult factories and error-kind names
 */

#include "ffmpeg_mcp/types.hpp"

#include <fmt/core.h>

namespace ffmpeg_mcp {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidCommand:
    return "InvalidCommand";
  case ErrorKind::InvalidWorkingDirectory:
    return "InvalidWorkingDirectory";
  case ErrorKind::InvalidParameters:
    return "InvalidParameters";
  case ErrorKind::ExecutionTimeout:
    return "ExecutionTimeout";
  case ErrorKind::ExecutionFault:
    return "ExecutionFault";
  case ErrorKind::NonZeroExit:
    return "NonZeroExit";
  }
  return "Unknown";
}

ExecutionResult ExecutionResult::completed(int exit_code, std::string out,
                                           std::string err) {
  ExecutionResult r;
  r.succeeded = (exit_code == 0);
  r.exit_code = exit_code;
  r.stdout_text = std::move(out);
  r.stderr_text = std::move(err);
  r.status = ExecutionStatus::Completed;
  if (!r.succeeded) {
    r.error_message =
        fmt::format("FFmpeg command failed with exit code {}", exit_code);
  }
  return r;
}

ExecutionResult ExecutionResult::timed_out(int timeout_seconds) {
  std::string msg =
      fmt::format("Command timed out after {} seconds", timeout_seconds);
  ExecutionResult r;
  r.stderr_text = msg;
  r.error_message = std::move(msg);
  r.status = ExecutionStatus::TimedOut;
  return r;
}

ExecutionResult ExecutionResult::faulted(const std::string &detail) {
  std::string msg = fmt::format("Execution error: {}", detail);
  ExecutionResult r;
  r.stderr_text = msg;
  r.error_message = std::move(msg);
  r.status = ExecutionStatus::Faulted;
  return r;
}

std::optional<ErrorKind> ExecutionResult::failure() const {
  switch (status) {
  case ExecutionStatus::TimedOut:
    return ErrorKind::ExecutionTimeout;
  case ExecutionStatus::Faulted:
    return ErrorKind::ExecutionFault;
  case ExecutionStatus::Completed:
    break;
  }
  if (succeeded)
    return std::nullopt;
  return ErrorKind::NonZeroExit;
}

} // namespace ffmpeg_mcp
