#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

#include "config/config.pb.h"

namespace macrelay::config {

inline constexpr char kDefaultFfmpegCommand[] =
    "ffmpeg -re -http_proxy <proxy> -timeout <timeout> -i <url> -map 0 -codec copy -f mpegts -flush_packets 0 "
    "-fflags +nobuffer -flags low_delay -strict experimental -analyzeduration 0 -probesize 32 -copyts -threads 12 pipe:";

inline constexpr char kDefaultWebFfmpegCommand[] =
    "ffmpeg -http_proxy <proxy> -loglevel panic -hide_banner -i <url> -vcodec copy -f mp4 -movflags frag_keyframe+empty_moov pipe:";

/*
  Effective per-request settings, with the defaults of unset config fields
  filled in.
*/
struct StreamingSettings {
  std::string ffmpeg_command{kDefaultFfmpegCommand};
  std::string web_ffmpeg_command{kDefaultWebFfmpegCommand};
  std::string ffprobe_path{"ffprobe"};
  std::uint32_t ffmpeg_timeout_seconds = 5;
  std::string stream_method{"ffmpeg"};
  std::string output_format{"mpegts"};
  bool try_all_macs = true;
  bool parallel_mac_probing = false;
  std::uint32_t parallel_mac_workers = 3;
  bool test_streams = true;
  std::size_t chunk_size_bytes = 16 * 1024;
};

struct HlsSettings {
  std::size_t max_streams = 10;
  std::chrono::seconds inactive_timeout{30};
  std::chrono::seconds reap_interval{10};
  std::string segment_type{"mpegts"};
  std::uint32_t segment_duration_seconds = 4;
  std::uint32_t playlist_size = 6;
  std::string temp_root;
  std::string ffmpeg_path{"ffmpeg"};
};

struct JobSettings {
  std::size_t max_workers = 2;
  std::uint32_t max_retries = 2;
  double channel_refresh_interval_hours = 24;
  double epg_refresh_interval_hours = 0.5;
  double vacuum_channels_interval_hours = 0;
};

StreamingSettings ResolveStreaming(const macrelay::runtime::config::StreamingConfig& config);
HlsSettings       ResolveHls(const macrelay::runtime::config::HlsConfig& config);
JobSettings       ResolveJobs(const macrelay::runtime::config::JobsConfig& config);

/*
  Holds the current settings snapshot. Readers get an immutable copy;
  Replace() swaps it atomically (SIGHUP reload).
*/
class SettingsStore {
 public:
  explicit SettingsStore(const macrelay::runtime::config::RuntimeConfig& config);

  void Replace(const macrelay::runtime::config::RuntimeConfig& config);

  StreamingSettings Streaming() const;
  JobSettings       Jobs() const;

 private:
  mutable std::shared_mutex mutex_;
  StreamingSettings         streaming_;
  JobSettings               jobs_;
};

} // namespace macrelay::config
