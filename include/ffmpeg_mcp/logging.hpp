/**
 * @file logging.hpp
 * @brief Logging macros and elapsed-time helper
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - elapsed_ms() for logging how long a child process ran
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so request logs interleave correctly when several
 *       HTTP worker threads log at once.
 *
 */

#ifndef FFMPEG_MCP_LOGGING_HPP
#define FFMPEG_MCP_LOGGING_HPP

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace ffmpeg_mcp {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffmpeg_mcp::log_mutex);                   \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffmpeg_mcp::log_mutex);                   \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffmpeg_mcp::log_mutex);                   \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffmpeg_mcp::log_mutex);                   \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffmpeg_mcp::log_mutex);                   \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING -----**

/**
 * @brief Milliseconds elapsed since start.
 * @param start Time point taken from std::chrono::steady_clock
 */
long elapsed_ms(std::chrono::steady_clock::time_point start);

/**
 * @brief Shorten a string for log lines.
 * @return s itself, or its first max_chars characters followed by "..."
 */
std::string abbreviate(const std::string &s, size_t max_chars = 100);

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_LOGGING_HPP
