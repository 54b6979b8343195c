/**
 * @file http_server.hpp
 * @brief HTTP transport: JSON-RPC endpoint plus REST endpoints
 *
 * @details Routes:
 *
 *          - POST /                           JSON-RPC 2.0 (MCP)
 *
 *          - GET  /mcp                        server metadata
 *
 *          - GET  /mcp/tools                  tool discovery
 *
 *          - POST /mcp/tools/{toolName}/invoke  tool invocation
 *
 *          - GET  /health                     liveness
 *
 * @note cpp-httplib runs each request on a worker thread from its own
 *       pool. An invocation holds its thread while it waits for an
 *       execution slot and while the child runs, so the pool is sized
 *       above the slot count (see worker_thread_count()) to keep
 *       /health and /mcp answering when every slot is busy.
 */

#ifndef FFMPEG_MCP_HTTP_SERVER_HPP
#define FFMPEG_MCP_HTTP_SERVER_HPP

#include <cstddef>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "json_rpc.hpp"
#include "tool_service.hpp"

namespace ffmpeg_mcp {

/**
 * @brief Serialize for an HTTP body.
 * @note Captured process output may not be valid UTF-8; invalid bytes are
 *       replaced by U+FFFD instead of failing the response.
 */
std::string dump_json(const nlohmann::json &j);

/// Worker threads kept free of tool invocations when auto-sizing the pool
constexpr size_t RESERVED_HTTP_WORKERS = 4;

/**
 * @class HttpServer
 * @brief Owns the httplib::Server and its routes.
 */
class HttpServer {
public:
  /**
   * @brief Construct and register all routes.
   * @param tools Tool service used by the REST invoke endpoint
   * @param rpc Dispatcher used by POST /
   */
  HttpServer(ToolService &tools, JsonRpcDispatcher &rpc);

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  /**
   * @brief Serve until stop() is called.
   * @return false if the socket could not be bound
   */
  bool listen(const std::string &host, int port);

  /**
   * @brief Bind to host on a free port chosen by the OS.
   * @return The port, or -1 on failure
   */
  int bind_to_any_port(const std::string &host);

  /// Serve on a socket bound by bind_to_any_port()
  bool listen_after_bind();

  /// Stop accepting and return from listen(); callable from any thread
  void stop();

  bool is_running() const { return server_.is_running(); }

  /// GET /mcp body
  nlohmann::json server_metadata() const { return metadata_; }

  /// GET /mcp/tools body
  static nlohmann::json rest_tools();

  /// GET /health body
  static nlohmann::json health();

  /// "result" member of a REST invoke response
  static nlohmann::json rest_result(const ExecutionResult &result);

  /**
   * @brief Size of the HTTP worker pool.
   * @param execution_slots Limiter capacity (0 = unlimited)
   * @param configured HTTP_WORKER_THREADS (0 = auto)
   * @return configured if positive, otherwise the larger of the httplib
   *         default and execution_slots + RESERVED_HTTP_WORKERS
   */
  static size_t worker_thread_count(int execution_slots, int configured);

  size_t worker_threads() const { return worker_threads_; }

private:
  void register_routes();
  void handle_invoke(const httplib::Request &req, httplib::Response &res);

  ToolService &tools_;
  JsonRpcDispatcher &rpc_;
  nlohmann::json metadata_;
  size_t worker_threads_;
  httplib::Server server_;
};

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_HTTP_SERVER_HPP
