/**
 * @file tool_service.hpp
 * @brief The ffmpeg tool, independent of the protocol that calls it
 *
 * @details Shared by the JSON-RPC dispatcher and the REST endpoints:
 *
 *          1. Parse tool arguments into a CommandRequest
 *
 *          2. validate_command(), then validate_working_directory()
 *
 *          3. Take an execution slot and run the executor
 *
 *          Steps 1 and 2 stop at the first failure and spawn nothing.
 *          Everything after step 2 ends in an ExecutionResult.
 */

#ifndef FFMPEG_MCP_TOOL_SERVICE_HPP
#define FFMPEG_MCP_TOOL_SERVICE_HPP

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "execution_limiter.hpp"
#include "types.hpp"

namespace ffmpeg_mcp {

/// Tool name on the JSON-RPC surface (tools/list, tools/call)
constexpr const char *RPC_TOOL_NAME = "ffmpeg_execute";

/// Tool name on the REST surface (/mcp/tools/{name}/invoke)
constexpr const char *REST_TOOL_NAME = "ffmpeg.execute";

constexpr const char *TOOL_DESCRIPTION =
    "Execute FFmpeg commands on the host machine and return success or "
    "failure with logs";

/**
 * @struct ToolError
 * @brief Rejection before execution (bad parameters or failed validation).
 */
struct ToolError {
  ErrorKind kind;
  std::string message;
};

/**
 * @struct ToolOutcome
 * @brief Either a rejection or an execution result.
 */
struct ToolOutcome {
  std::optional<ToolError> error;
  ExecutionResult result;

  bool executed() const { return !error.has_value(); }
};

/**
 * @class ToolService
 * @brief Validates and runs ffmpeg tool invocations.
 */
class ToolService {
public:
  using Executor = std::function<ExecutionResult(
      const std::string &, const std::string &, std::optional<int>)>;

  /**
   * @brief Construct a service.
   * @param limiter Slot pool shared by all requests
   * @param executor Runs a validated command (execute_ffmpeg_command
   *                 unless replaced in tests)
   */
  explicit ToolService(ExecutionLimiter &limiter, Executor executor = {});

  /**
   * @brief Parse tool arguments.
   *
   * @note Accepted keys: command (string, required), workingDir or
   *       workingDirectory (string or null), timeout or timeoutSeconds
   *       (integer 1..21600 or null).
   *
   * @param arguments JSON object from the caller
   * @param request Output: parsed request
   * @return InvalidParameters error, or nothing on success
   */
  static std::optional<ToolError> parse_request(const nlohmann::json &arguments,
                                                CommandRequest &request);

  /// Parse, validate and execute
  ToolOutcome invoke(const nlohmann::json &arguments);

  /// Validate and execute an already parsed request
  ToolOutcome invoke(const CommandRequest &request);

  /// JSON Schema of the tool arguments
  static nlohmann::json input_schema();

  const ExecutionLimiter &limiter() const { return limiter_; }

private:
  ExecutionLimiter &limiter_;
  Executor executor_;
};

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_TOOL_SERVICE_HPP
