/**
 * @file json_rpc.hpp
 * @brief MCP message handling over JSON-RPC 2.0
 *
 * @details Supported methods:
 *
 *          - initialize: protocol version, capabilities, server info
 *
 *          - ping: empty result
 *
 *          - tools/list: the ffmpeg_execute tool and its input schema
 *
 *          - tools/call: run ffmpeg_execute through ToolService
 *
 *          - notifications/*: accepted, no response
 *
 * @note Validation failures are JSON-RPC errors (-32602). Failed,
 *       timed-out and faulted executions are normal results with
 *       isError = true.
 */

#ifndef FFMPEG_MCP_JSON_RPC_HPP
#define FFMPEG_MCP_JSON_RPC_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "tool_service.hpp"

namespace ffmpeg_mcp {

constexpr const char *SERVER_NAME = "ffmpeg-mcp-server";
constexpr const char *SERVER_VERSION = "1.0.0";
constexpr const char *MCP_PROTOCOL_VERSION = "2024-11-05";

/// JSON-RPC 2.0 error codes
namespace rpc_error {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace rpc_error

/**
 * @class JsonRpcDispatcher
 * @brief Turns one JSON-RPC request body into one response.
 */
class JsonRpcDispatcher {
public:
  explicit JsonRpcDispatcher(ToolService &tools) : tools_(tools) {}

  /**
   * @brief Handle a raw request body.
   * @return Response object, or nothing for a notification
   */
  std::optional<nlohmann::json> handle(const std::string &body);

  /**
   * @brief Handle an already parsed message.
   * @return Response object, or nothing for a notification
   */
  std::optional<nlohmann::json> handle(const nlohmann::json &message);

  /**
   * @brief Text block returned to MCP clients for a finished execution.
   */
  static std::string format_execution_text(const ExecutionResult &result);

  static nlohmann::json make_result(const nlohmann::json &id,
                                    nlohmann::json result);
  static nlohmann::json make_error(const nlohmann::json &id, int code,
                                   const std::string &message);

private:
  nlohmann::json dispatch(const nlohmann::json &id, const std::string &method,
                          const nlohmann::json &params);
  nlohmann::json handle_initialize(const nlohmann::json &id);
  nlohmann::json handle_tools_list(const nlohmann::json &id);
  nlohmann::json handle_tools_call(const nlohmann::json &id,
                                   const nlohmann::json &params);

  ToolService &tools_;
};

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_JSON_RPC_HPP
