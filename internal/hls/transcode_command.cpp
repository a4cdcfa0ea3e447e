#include "transcode_command.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace macrelay::hls {

namespace {

bool EndsWith(const std::string& s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool IsHlsSource(const std::string& link) {
  static constexpr std::array<std::string_view, 3> kIndicators{".m3u8", "hls", "stitcher"};

  std::string lower(link);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  return std::any_of(kIndicators.begin(), kIndicators.end(), [&](std::string_view needle) { return lower.find(needle) != std::string::npos; });
}

std::vector<std::string> BuildTranscodeCommand(const std::string& ffmpeg_path, const std::string& link, const std::string& proxy,
                                               std::chrono::seconds timeout, const SegmentShape& shape, const std::string& output_dir) {
  const bool fmp4 = shape.segment_type == "fmp4";

  std::vector<std::string> cmd{ffmpeg_path,
                               "-fflags",
                               "+genpts+igndts+nobuffer",
                               "-err_detect",
                               "aggressive",
                               "-flags",
                               "low_delay",
                               "-reconnect",
                               "1",
                               "-reconnect_at_eof",
                               "1",
                               "-reconnect_streamed",
                               "1",
                               "-reconnect_delay_max",
                               "15"};

  if (!proxy.empty()) {
    cmd.insert(cmd.end(), {"-http_proxy", proxy});
  }
  cmd.insert(cmd.end(), {"-timeout", std::to_string(timeout.count() * 1000000LL)});

  cmd.insert(cmd.end(), {"-i", link, "-map", "0", "-c:v", "copy", "-copyts", "-start_at_zero"});
  cmd.insert(cmd.end(), {"-c:a", "aac", "-b:a", "256k", "-af", "aresample=async=1"});

  std::string hls_flags = "independent_segments+omit_endlist";
  if (!fmp4) {
    hls_flags += "+program_date_time";
    cmd.insert(cmd.end(), {"-mpegts_flags", "pat_pmt_at_frames", "-pcr_period", "20"});
  }

  const std::string segment_pattern = output_dir + (fmp4 ? "/seg_%03d.m4s" : "/seg_%03d.ts");
  cmd.insert(cmd.end(), {"-f", "hls", "-hls_time", std::to_string(shape.duration_seconds), "-hls_list_size", std::to_string(shape.playlist_size),
                         "-hls_flags", hls_flags, "-hls_segment_type", fmp4 ? "fmp4" : "mpegts", "-hls_segment_filename", segment_pattern,
                         "-start_number", "0", "-flush_packets", "0"});

  if (fmp4) {
    cmd.insert(cmd.end(), {"-hls_fmp4_init_filename", "init.mp4"});
  }

  cmd.push_back(output_dir + "/" + kMediaPlaylist);
  return cmd;
}

std::string PassthroughMasterPlaylist(const std::string& link) {
  return "#EXTM3U\n"
         "#EXT-X-VERSION:7\n"
         "#EXT-X-STREAM-INF:BANDWIDTH=15000000,CODECS=\"avc1.640028,mp4a.40.2\"\n" +
         link + "\n";
}

// ffmpeg writes no master playlist for a single rendition
std::string TranscodeMasterPlaylist() {
  return "#EXTM3U\n"
         "#EXT-X-VERSION:3\n"
         "#EXT-X-STREAM-INF:BANDWIDTH=5000000\n"
         "stream.m3u8\n";
}

std::string MimeTypeFor(const std::string& filename) {
  if (EndsWith(filename, ".m3u8")) return "application/vnd.apple.mpegurl";
  if (EndsWith(filename, ".ts")) return "video/mp2t";
  if (EndsWith(filename, ".m4s") || EndsWith(filename, ".mp4")) return "video/mp4";
  return "application/octet-stream";
}

} // namespace macrelay::hls
