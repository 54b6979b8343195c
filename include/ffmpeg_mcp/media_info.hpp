/**
 * @file media_info.hpp
 * @brief Versions of the FFmpeg libraries linked into the server
 *
 * @details Reported by GET /mcp and in the startup banner, next to the
 *          ffmpeg binary found on PATH, so a mismatch between the two is
 *          visible to operators.
 */

#ifndef FFMPEG_MCP_MEDIA_INFO_HPP
#define FFMPEG_MCP_MEDIA_INFO_HPP

#include <string>

namespace ffmpeg_mcp {

/**
 * @struct LibraryVersions
 * @brief "major.minor.micro" of each library plus the FFmpeg build string.
 */
struct LibraryVersions {
  std::string avutil;
  std::string avcodec;
  std::string avformat;
  std::string ffmpeg; //< av_version_info(), e.g. "6.1.1" or a git describe
};

/**
 * @brief Query the runtime library versions.
 * @note Runtime, not compile-time: these come from the shared objects
 *       actually loaded.
 */
LibraryVersions linked_library_versions();

/**
 * @brief Render an AV_VERSION_INT value as "major.minor.micro".
 */
std::string format_av_version(unsigned version);

} // namespace ffmpeg_mcp

#endif // FFMPEG_MCP_MEDIA_INFO_HPP
