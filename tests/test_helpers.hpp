/**
 * @file test_helpers.hpp
 * @brief Fixtures shared by the unit tests
 */

#ifndef FFMPEG_MCP_TEST_HELPERS_HPP
#define FFMPEG_MCP_TEST_HELPERS_HPP

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

#include <signal.h>
#include <unistd.h>

namespace ffmpeg_mcp::test {

/// Unique directory under $TMPDIR, removed with its contents on scope exit
class TempDir {
public:
  TempDir() {
    std::string tmpl =
        (std::filesystem::temp_directory_path() / "ffmpeg_mcp_test_XXXXXX")
            .string();
    if (char *p = ::mkdtemp(tmpl.data()))
      path_ = std::filesystem::canonical(p);
  }
  ~TempDir() {
    std::error_code ec;
    if (!path_.empty())
      std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }
  std::string str() const { return path_.string(); }

  std::filesystem::path write_file(const std::string &name,
                                   const std::string &content) const {
    auto p = path_ / name;
    std::ofstream(p, std::ios::binary) << content;
    return p;
  }

private:
  std::filesystem::path path_;
};

/// Read an integer written by a child (e.g. `echo $! > file`)
inline pid_t read_pid_file(const std::filesystem::path &p) {
  for (int i = 0; i < 100; ++i) {
    std::ifstream f(p);
    long pid = 0;
    if (f >> pid && pid > 0)
      return static_cast<pid_t>(pid);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return -1;
}

/// True if pid is gone or a zombie (killed but not yet reaped by init)
inline bool process_is_dead(pid_t pid) {
  if (::kill(pid, 0) != 0)
    return true;
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!std::getline(stat, line))
    return true;
  auto close_paren = line.rfind(')');
  return close_paren != std::string::npos && close_paren + 2 < line.size() &&
         (line[close_paren + 2] == 'Z' || line[close_paren + 2] == 'X');
}

/// Poll process_is_dead() for up to timeout
inline bool wait_for_death(pid_t pid, std::chrono::milliseconds timeout =
                                          std::chrono::milliseconds(3000)) {
  auto give_up = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < give_up) {
    if (process_is_dead(pid))
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return process_is_dead(pid);
}

} // namespace ffmpeg_mcp::test

#endif // FFMPEG_MCP_TEST_HELPERS_HPP
