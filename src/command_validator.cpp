/**
 * @file command_validator.cpp
 * @brief Command and working directory validation
 */

#include "ffmpeg_mcp/command_validator.hpp"

#include <cctype>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

namespace ffmpeg_mcp {

namespace fs = std::filesystem;

std::string trim_copy(const std::string &s) {
  size_t start = 0;
  while (start < s.size() &&
         std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

ValidationOutcome validate_command(const std::string &command) {
  std::string trimmed = trim_copy(command);

  if (trimmed.compare(0, COMMAND_PREFIX.size(), COMMAND_PREFIX) != 0) {
    return ValidationOutcome::fail(ErrorKind::InvalidCommand,
                                   "Command must start with 'ffmpeg '");
  }

  for (std::string_view op : BLOCKED_OPERATORS) {
    if (trimmed.find(op) != std::string::npos) {
      return ValidationOutcome::fail(
          ErrorKind::InvalidCommand,
          fmt::format("Blocked shell operator detected: {}", op));
    }
  }

  /// On the raw input: a trailing line break must not be trimmed away
  if (command.find_first_of("\r\n") != std::string::npos) {
    return ValidationOutcome::fail(ErrorKind::InvalidCommand,
                                   "Newlines are not allowed in commands");
  }

  return ValidationOutcome::ok(std::move(trimmed));
}

ValidationOutcome
validate_working_directory(const std::optional<std::string> &working_dir) {
  std::error_code ec;

  if (!working_dir || working_dir->empty()) {
    fs::path cwd = fs::current_path(ec);
    if (ec) {
      return ValidationOutcome::fail(
          ErrorKind::InvalidWorkingDirectory,
          fmt::format("Invalid working directory: {}", ec.message()));
    }
    return ValidationOutcome::ok(cwd.string());
  }

  /// std::filesystem would silently truncate at an embedded NUL
  if (working_dir->find('\0') != std::string::npos) {
    return ValidationOutcome::fail(
        ErrorKind::InvalidWorkingDirectory,
        "Invalid working directory: embedded null byte");
  }

  fs::path resolved = fs::absolute(*working_dir, ec);
  if (ec) {
    return ValidationOutcome::fail(
        ErrorKind::InvalidWorkingDirectory,
        fmt::format("Invalid working directory: {}", ec.message()));
  }
  resolved = resolved.lexically_normal();
  /// lexically_normal keeps a trailing separator ("/tmp/x/")
  if (resolved.has_relative_path() && !resolved.has_filename())
    resolved = resolved.parent_path();

  /// ENOENT and ENOTDIR both come back as not_found
  fs::file_status st = fs::status(resolved, ec);
  if (st.type() == fs::file_type::not_found) {
    return ValidationOutcome::fail(
        ErrorKind::InvalidWorkingDirectory,
        fmt::format("Working directory does not exist: {}", resolved.string()));
  }

  if (ec) {
    return ValidationOutcome::fail(
        ErrorKind::InvalidWorkingDirectory,
        fmt::format("Invalid working directory: {}", ec.message()));
  }

  if (!fs::is_directory(st)) {
    return ValidationOutcome::fail(
        ErrorKind::InvalidWorkingDirectory,
        fmt::format("Working directory is not a directory: {}",
                    resolved.string()));
  }

  return ValidationOutcome::ok(resolved.string());
}

} // namespace ffmpeg_mcp
