/**
 * @file system.hpp
 * @brief System utilities and CPU detection
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Execution slot calculation for the concurrency limiter
 *
 *          - Lookup of executables on PATH
 */

#ifndef FFMPEG_MCP_SYSTEM_HPP
#define FFMPEG_MCP_SYSTEM_HPP

#include <string>
#include <vector>

namespace ffmpeg_mcp {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Parse a cpuset list such as "0,2,4" or "0-3,8".
 * @return CPU IDs in the order listed (empty for malformed input)
 */
std::vector<int> parse_cpuset_string(const std::string &line);

/**
 * @brief Number of concurrent executions to allow.
 *
 * @note Uses MAX_CONCURRENT_EXECUTIONS:
 *
 *       - 0 (auto) = detect_cpu_limit()
 *
 *       - negative = unlimited, returned as 0
 *
 *       - N = N
 *
 * @return Slot count, or 0 for no limit
 */
int calculate_execution_slots();

// **---- Executables ----**

/**
 * @brief Search PATH for an executable file.
 * @param name Program name without directory
 * @return Absolute path, or empty string if not found
 */
std::string find_executable(const std::string &name);

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_SYSTEM_HPP
