/**
 * @file tool_service.cpp
 * @brief Tool argument parsing, validation and execution
 */

#include "ffmpeg_mcp/tool_service.hpp"

#include <utility>

#include <fmt/core.h>

#include "ffmpeg_mcp/command_validator.hpp"
#include "ffmpeg_mcp/ffmpeg_executor.hpp"
#include "ffmpeg_mcp/logging.hpp"

namespace ffmpeg_mcp {

using json = nlohmann::json;

namespace {

ToolError invalid_parameters(const std::string &detail) {
  return {ErrorKind::InvalidParameters,
          fmt::format("Invalid parameters: {}", detail)};
}

/// First key present in args, or end()
json::const_iterator find_either(const json &args, const char *key,
                                 const char *alias) {
  auto it = args.find(key);
  if (it == args.end())
    it = args.find(alias);
  return it;
}

} // anonymous namespace

ToolService::ToolService(ExecutionLimiter &limiter, Executor executor)
    : limiter_(limiter), executor_(std::move(executor)) {
  if (!executor_) {
    executor_ = [](const std::string &command, const std::string &dir,
                   std::optional<int> timeout) {
      return execute_ffmpeg_command(command, dir, timeout);
    };
  }
}

// **----- Parsing -----**

std::optional<ToolError> ToolService::parse_request(const json &arguments,
                                                    CommandRequest &request) {
  if (!arguments.is_object())
    return invalid_parameters("arguments must be an object");

  auto cmd = arguments.find("command");
  if (cmd == arguments.end() || cmd->is_null())
    return invalid_parameters("command is required");
  if (!cmd->is_string())
    return invalid_parameters("command must be a string");
  request.command = cmd->get<std::string>();

  request.working_dir.reset();
  auto dir = find_either(arguments, "workingDir", "workingDirectory");
  if (dir != arguments.end() && !dir->is_null()) {
    if (!dir->is_string())
      return invalid_parameters("workingDir must be a string");
    request.working_dir = dir->get<std::string>();
  }

  request.timeout_seconds.reset();
  auto timeout = find_either(arguments, "timeout", "timeoutSeconds");
  if (timeout != arguments.end() && !timeout->is_null()) {
    if (!timeout->is_number_integer())
      return invalid_parameters("timeout must be an integer");
    /// Compare as int64 first so huge values cannot wrap into range
    auto value = timeout->get<long long>();
    if (value < MIN_TIMEOUT_SECONDS || value > MAX_TIMEOUT_SECONDS) {
      return invalid_parameters(
          fmt::format("timeout must be between {} and {} seconds",
                      MIN_TIMEOUT_SECONDS, MAX_TIMEOUT_SECONDS));
    }
    request.timeout_seconds = static_cast<int>(value);
  }

  return std::nullopt;
}

// **----- Invocation -----**

ToolOutcome ToolService::invoke(const json &arguments) {
  CommandRequest request;
  if (auto err = parse_request(arguments, request)) {
    LOG_WARN("Rejected tool arguments: {}", err->message);
    return {std::move(err), {}};
  }
  return invoke(request);
}

ToolOutcome ToolService::invoke(const CommandRequest &request) {
  ValidationOutcome command = validate_command(request.command);
  if (!command) {
    LOG_WARN("Rejected command: {}", command.reason);
    return {ToolError{command.kind, command.reason}, {}};
  }

  ValidationOutcome dir = validate_working_directory(request.working_dir);
  if (!dir) {
    LOG_WARN("Rejected working directory: {}", dir.reason);
    return {ToolError{dir.kind, dir.reason}, {}};
  }

  if (!limiter_.unlimited() && limiter_.in_flight() >= limiter_.capacity()) {
    LOG_INFO("All {} execution slots busy, waiting", limiter_.capacity());
  }
  auto permit = limiter_.acquire();

  return {std::nullopt,
          executor_(command.value, dir.value, request.timeout_seconds)};
}

// **----- Metadata -----**

json ToolService::input_schema() {
  return {
      {"type", "object"},
      {"properties",
       {{"command",
         {{"type", "string"},
          {"description", "FFmpeg command to execute. Must start with "
                          "'ffmpeg '"}}},
        {"workingDir",
         {{"type", "string"},
          {"description", "Optional working directory for execution. "
                          "Defaults to current directory."}}},
        {"timeout",
         {{"type", "integer"},
          {"description",
           fmt::format("Execution timeout in seconds ({}-{}). Omit for no "
                       "limit.",
                       MIN_TIMEOUT_SECONDS, MAX_TIMEOUT_SECONDS)},
          {"minimum", MIN_TIMEOUT_SECONDS},
          {"maximum", MAX_TIMEOUT_SECONDS}}}}},
      {"required", json::array({"command"})}};
}

} // namespace ffmpeg_mcp
