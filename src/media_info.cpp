/**
 * @file media_info.cpp
 * @brief FFmpeg library version reporting
 */

#include "ffmpeg_mcp/media_info.hpp"

#include <fmt/core.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

namespace ffmpeg_mcp {

std::string format_av_version(unsigned version) {
  return fmt::format("{}.{}.{}", AV_VERSION_MAJOR(version),
                     AV_VERSION_MINOR(version), AV_VERSION_MICRO(version));
}

LibraryVersions linked_library_versions() {
  LibraryVersions v;
  v.avutil = format_av_version(avutil_version());
  v.avcodec = format_av_version(avcodec_version());
  v.avformat = format_av_version(avformat_version());
  const char *info = av_version_info();
  v.ffmpeg = info ? info : "unknown";
  return v;
}

} // namespace ffmpeg_mcp
