/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Execution slot calculation
 *
 *          - PATH lookup
 */

#include "ffmpeg_mcp/system.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <sys/stat.h>
#include <unistd.h>

#include "ffmpeg_mcp/config.hpp"

namespace ffmpeg_mcp {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Helper to count CPUs from cpuset string
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  auto cpus = parse_cpuset_string(line);
  return cpus.empty() ? -1 : static_cast<int>(cpus.size());
}

} // anonymous namespace

std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  if (line.empty())
    return cpus;

  try {
    size_t pos = 0;
    while (pos < line.size()) {
      size_t end = line.find_first_of(",-", pos);
      if (end == std::string::npos)
        end = line.size();

      int start_cpu = std::stoi(line.substr(pos, end - pos));

      if (end < line.size() && line[end] == '-') {
        /// Range like "0-3"
        pos = end + 1;
        end = line.find(',', pos);
        if (end == std::string::npos)
          end = line.size();
        int end_cpu = std::stoi(line.substr(pos, end - pos));
        for (int cpu = start_cpu; cpu <= end_cpu; ++cpu) {
          cpus.push_back(cpu);
        }
      } else {
        /// Single CPU
        cpus.push_back(start_cpu);
      }

      pos = (end < line.size()) ? end + 1 : line.size();
    }
  } catch (const std::logic_error &) {
    /// std::stoi throws invalid_argument / out_of_range on garbage
    cpus.clear();
  }
  return cpus;
}

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        long quota = std::strtol(quota_str.c_str(), nullptr, 10);
        long period = std::strtol(period_str.c_str(), nullptr, 10);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int calculate_execution_slots() {
  int configured = Config::max_concurrent_executions();

  if (configured < 0)
    return 0;
  if (configured == 0)
    return detect_cpu_limit();
  return configured;
}

// **---- Executables ----**

std::string find_executable(const std::string &name) {
  const char *path_env = std::getenv("PATH");
  if (!path_env || name.empty())
    return {};

  std::string path = path_env;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t end = path.find(':', pos);
    if (end == std::string::npos)
      end = path.size();
    std::string dir = path.substr(pos, end - pos);
    if (dir.empty())
      dir = ".";
    std::string candidate = dir + "/" + name;
    struct stat st;
    if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        access(candidate.c_str(), X_OK) == 0)
      return candidate;
    pos = end + 1;
  }
  return {};
}

} // namespace ffmpeg_mcp
