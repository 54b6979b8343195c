/**
 * @file types.hpp
 * @brief Core data types and constants for the FFmpeg MCP server
 *
 * @details Contains the value types passed between the validator, the
 *          executor and the protocol layer:
 *
 *          - Command prefix, denylist and timeout bounds
 *
 *          - CommandRequest for a parsed tool invocation
 *
 *          - ValidationOutcome for validator verdicts
 *
 *          - ExecutionResult for a finished child process
 */

#ifndef FFMPEG_MCP_TYPES_HPP
#define FFMPEG_MCP_TYPES_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ffmpeg_mcp {

// **----- CONSTANTS -----**

/// Literal prefix every accepted command starts with (after trimming)
constexpr std::string_view COMMAND_PREFIX = "ffmpeg ";

/**
 * @brief Shell operators rejected anywhere in a command.
 * @note Substring match, checked in this order. "$(" and "${" can never be
 *       reported because "$" matches first; they stay listed so the set is
 *       complete on its own.
 */
constexpr std::array<std::string_view, 10> BLOCKED_OPERATORS = {
    "&&", "||", ";", "|", ">", "<", "`", "$", "$(", "${"};

constexpr int MIN_TIMEOUT_SECONDS = 1;
constexpr int MAX_TIMEOUT_SECONDS = 21600; //< 6 hours

/// Exit code reported when no real exit status exists (timeout, fault)
constexpr int NO_EXIT_CODE = -1;

// **----- ERROR TAXONOMY -----**

enum class ErrorKind {
  InvalidCommand,
  InvalidWorkingDirectory,
  InvalidParameters,
  ExecutionTimeout,
  ExecutionFault,
  NonZeroExit
};

const char *to_string(ErrorKind kind);

// **----- DATA STRUCTURES -----**

/**
 * @struct CommandRequest
 * @brief A tool invocation as received from a caller.
 */
struct CommandRequest {
  std::string command;                      //< Raw command line
  std::optional<std::string> working_dir;   //< Absent = current directory
  std::optional<int> timeout_seconds;       //< Absent = unlimited
};

/**
 * @struct ValidationOutcome
 * @brief Verdict of a validator check.
 * @note When valid, value holds the canonical form (trimmed command or
 *       resolved directory). When invalid, reason holds the message shown
 *       to the caller.
 */
struct ValidationOutcome {
  bool valid = false;
  ErrorKind kind = ErrorKind::InvalidCommand;
  std::string value;
  std::string reason;

  static ValidationOutcome ok(std::string canonical) {
    ValidationOutcome out;
    out.valid = true;
    out.value = std::move(canonical);
    return out;
  }

  static ValidationOutcome fail(ErrorKind kind, std::string reason) {
    ValidationOutcome out;
    out.kind = kind;
    out.reason = std::move(reason);
    return out;
  }

  explicit operator bool() const { return valid; }
};

/// Terminal state of one executor run
enum class ExecutionStatus { Completed, TimedOut, Faulted };

/**
 * @struct ExecutionResult
 * @brief Outcome of one child process.
 * @note succeeded is true iff exit_code == 0. Built once per invocation
 *       through the factories below and not modified afterwards.
 */
struct ExecutionResult {
  bool succeeded = false;
  int exit_code = NO_EXIT_CODE;
  std::string stdout_text;
  std::string stderr_text;
  std::optional<std::string> error_message;
  ExecutionStatus status = ExecutionStatus::Faulted;

  static ExecutionResult completed(int exit_code, std::string out,
                                   std::string err);
  static ExecutionResult timed_out(int timeout_seconds);
  static ExecutionResult faulted(const std::string &detail);

  /// Error category, or nothing for a successful run
  std::optional<ErrorKind> failure() const;
};

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_TYPES_HPP
