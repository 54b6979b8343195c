/**
 * @file logging.cpp
 * @brief Logging utilities implementation
 *
 * @details Provides:
 *          - Global log mutex
 *
 *          - Elapsed-time and log abbreviation helpers
 */

#include "ffmpeg_mcp/logging.hpp"

#include <string>

namespace ffmpeg_mcp {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- HELPERS -----**

long elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto now = std::chrono::steady_clock::now();
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now - start)
          .count());
}

std::string abbreviate(const std::string &s, size_t max_chars) {
  if (s.size() <= max_chars)
    return s;
  return s.substr(0, max_chars) + "...";
}

} // namespace ffmpeg_mcp
