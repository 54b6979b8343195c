/**
 * @file command_validator.hpp
 * @brief Checks run on untrusted input before any process is spawned
 *
 * @details Two independent checks, both read-only:
 *
 *          - validate_command(): prefix, shell operator denylist, newlines
 *
 *          - validate_working_directory(): resolve and check existence
 *
 * @note The denylist is a blocklist of substrings, not a parser. An
 *       argument that merely contains one of the sequences (for example a
 *       filter graph using ';') is rejected as well.
 */

#ifndef FFMPEG_MCP_COMMAND_VALIDATOR_HPP
#define FFMPEG_MCP_COMMAND_VALIDATOR_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace ffmpeg_mcp {

/**
 * @brief Strip leading and trailing whitespace.
 */
std::string trim_copy(const std::string &s);

/**
 * @brief Check that a command is an ffmpeg invocation without chaining.
 *
 * @param command Raw command line from the caller
 * @return Valid with the trimmed command, or Invalid(InvalidCommand)
 */
ValidationOutcome validate_command(const std::string &command);

/**
 * @brief Resolve and check the directory the command will run in.
 *
 * @note Paths outside any project root are accepted; only existence and
 *       directory-ness are checked.
 *
 * @param working_dir Directory from the caller (absent/empty = current)
 * @return Valid with the absolute path, or Invalid(InvalidWorkingDirectory)
 */
ValidationOutcome
validate_working_directory(const std::optional<std::string> &working_dir);

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_COMMAND_VALIDATOR_HPP
