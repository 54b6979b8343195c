/**
 * @file ffmpeg_executor.hpp
 * @brief Runs one validated FFmpeg command line and reports the outcome
 *
 * @details The command is handed to /bin/sh so that quoting in ffmpeg
 *          arguments works as on a terminal. Chaining operators have been
 *          rejected by validate_command() before this point.
 *
 *          Outcomes (all returned, never thrown):
 *
 *          - Completed: exit code 0 (success) or nonzero (failure message)
 *
 *          - TimedOut: process group killed, exit code -1
 *
 *          - Faulted: spawn or I/O failure, exit code -1
 */

#ifndef FFMPEG_MCP_FFMPEG_EXECUTOR_HPP
#define FFMPEG_MCP_FFMPEG_EXECUTOR_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace ffmpeg_mcp {

/**
 * @brief Execute an already validated command.
 *
 * @note The timeout range is checked by the caller; any positive value is
 *       honoured here. Exactly one process is launched, without retries.
 *
 * @param command Canonical command from validate_command()
 * @param working_dir Resolved directory from validate_working_directory()
 * @param timeout_seconds Wall-clock limit (nullopt = unlimited)
 * @return Result with exit code and captured stdout/stderr
 */
ExecutionResult
execute_ffmpeg_command(const std::string &command,
                       const std::string &working_dir,
                       std::optional<int> timeout_seconds = std::nullopt);

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_FFMPEG_EXECUTOR_HPP
