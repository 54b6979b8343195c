/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/ffmpeg_mcp.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef FFMPEG_MCP_CONFIG_HPP
#define FFMPEG_MCP_CONFIG_HPP

#include <cstddef>
#include <cstdlib>
#include <string>

namespace ffmpeg_mcp {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- HTTP LISTENER ----**

/// Address the HTTP listener binds to
inline const std::string &host() {
  static std::string val = get_env_string("MCP_HOST", "0.0.0.0");
  return val;
}

/// TCP port of the HTTP listener
inline int port() {
  static int val = get_env_int("MCP_PORT", 8765);
  return val;
}

/// Socket read timeout for HTTP clients
inline int http_read_timeout_sec() {
  static int val = get_env_int("HTTP_READ_TIMEOUT_SEC", 300);
  return val;
}

/**
 * @brief Socket write timeout for HTTP clients
 * @note Responses are written after the child finishes, so this does not
 *       bound execution time.
 */
inline int http_write_timeout_sec() {
  static int val = get_env_int("HTTP_WRITE_TIMEOUT_SEC", 300);
  return val;
}

/// Largest accepted request body in bytes
inline size_t max_request_bytes() {
  static size_t val =
      static_cast<size_t>(get_env_int("MAX_REQUEST_BYTES", 1024 * 1024));
  return val;
}

// **---- EXECUTION ----**

/**
 * @brief Maximum number of FFmpeg processes running at the same time
 * @note - 0 = auto-detect: one slot per CPU available to the container
 *
 *       - negative = unlimited
 *
 *       - N = at most N children; further requests wait for a slot
 */
inline int max_concurrent_executions() {
  static int val = get_env_int("MAX_CONCURRENT_EXECUTIONS", 0);
  return val;
}

/**
 * @brief Size of the HTTP worker thread pool
 * @note - 0 = auto: enough threads for every execution slot plus a reserve
 *         for /health, /mcp and JSON-RPC requests that do not execute
 *
 *       - N = exactly N threads
 */
inline int http_worker_threads() {
  static int val = get_env_int("HTTP_WORKER_THREADS", 0);
  return val;
}

} // namespace Config
} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_CONFIG_HPP
