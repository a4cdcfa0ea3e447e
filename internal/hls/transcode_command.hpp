#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace macrelay::hls {

struct SegmentShape {
  // "mpegts" or "fmp4"
  std::string   segment_type{"mpegts"};
  std::uint32_t duration_seconds = 4;
  std::uint32_t playlist_size    = 6;
};

inline constexpr char kMasterPlaylist[] = "master.m3u8";
inline constexpr char kMediaPlaylist[]  = "stream.m3u8";

// Sources that already speak HLS are handed to the client untouched.
bool IsHlsSource(const std::string& link);

/*
  ffmpeg argv for one shared transcode: video copied, audio re-encoded to
  AAC, segments and stream.m3u8 written into output_dir.
*/
std::vector<std::string> BuildTranscodeCommand(const std::string& ffmpeg_path, const std::string& link, const std::string& proxy,
                                               std::chrono::seconds timeout, const SegmentShape& shape, const std::string& output_dir);

std::string PassthroughMasterPlaylist(const std::string& link);
std::string TranscodeMasterPlaylist();

std::string MimeTypeFor(const std::string& filename);

} // namespace macrelay::hls
