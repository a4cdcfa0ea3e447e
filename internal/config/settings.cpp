#include "settings.hpp"

#include <algorithm>
#include <mutex>

namespace macrelay::config {

StreamingSettings ResolveStreaming(const macrelay::runtime::config::StreamingConfig& config) {
  StreamingSettings s;
  if (!config.ffmpeg_command().empty()) s.ffmpeg_command = config.ffmpeg_command();
  if (!config.web_ffmpeg_command().empty()) s.web_ffmpeg_command = config.web_ffmpeg_command();
  if (!config.ffprobe_path().empty()) s.ffprobe_path = config.ffprobe_path();
  if (config.has_ffmpeg_timeout_seconds()) s.ffmpeg_timeout_seconds = config.ffmpeg_timeout_seconds();
  if (!config.stream_method().empty()) s.stream_method = config.stream_method();
  if (!config.output_format().empty()) s.output_format = config.output_format();
  if (config.has_try_all_macs()) s.try_all_macs = config.try_all_macs();
  s.parallel_mac_probing = config.parallel_mac_probing();
  if (config.has_parallel_mac_workers()) s.parallel_mac_workers = std::max<std::uint32_t>(1, config.parallel_mac_workers());
  if (config.has_test_streams()) s.test_streams = config.test_streams();
  if (config.has_chunk_size_bytes() && config.chunk_size_bytes() > 0) s.chunk_size_bytes = config.chunk_size_bytes();
  return s;
}

HlsSettings ResolveHls(const macrelay::runtime::config::HlsConfig& config) {
  HlsSettings s;
  if (config.has_max_streams()) s.max_streams = config.max_streams();
  if (config.has_inactive_timeout_seconds()) s.inactive_timeout = std::chrono::seconds(config.inactive_timeout_seconds());
  if (config.has_reap_interval_seconds() && config.reap_interval_seconds() > 0) {
    s.reap_interval = std::chrono::seconds(config.reap_interval_seconds());
  }
  if (!config.segment_type().empty()) s.segment_type = config.segment_type();
  if (config.has_segment_duration_seconds()) s.segment_duration_seconds = config.segment_duration_seconds();
  if (config.has_playlist_size()) s.playlist_size = config.playlist_size();
  s.temp_root = config.temp_root();
  if (!config.ffmpeg_path().empty()) s.ffmpeg_path = config.ffmpeg_path();
  return s;
}

JobSettings ResolveJobs(const macrelay::runtime::config::JobsConfig& config) {
  JobSettings s;
  if (config.has_max_workers()) s.max_workers = std::max<std::uint32_t>(1, config.max_workers());
  if (config.has_max_retries()) s.max_retries = config.max_retries();
  if (config.has_channel_refresh_interval_hours()) s.channel_refresh_interval_hours = config.channel_refresh_interval_hours();
  if (config.has_epg_refresh_interval_hours()) s.epg_refresh_interval_hours = config.epg_refresh_interval_hours();
  s.vacuum_channels_interval_hours = config.vacuum_channels_interval_hours();
  return s;
}

SettingsStore::SettingsStore(const macrelay::runtime::config::RuntimeConfig& config)
    : streaming_(ResolveStreaming(config.streaming())), jobs_(ResolveJobs(config.jobs())) {
}

void SettingsStore::Replace(const macrelay::runtime::config::RuntimeConfig& config) {
  auto streaming = ResolveStreaming(config.streaming());
  auto jobs      = ResolveJobs(config.jobs());

  std::unique_lock lock(mutex_);
  streaming_ = std::move(streaming);
  jobs_      = std::move(jobs);
}

StreamingSettings SettingsStore::Streaming() const {
  std::shared_lock lock(mutex_);
  return streaming_;
}

JobSettings SettingsStore::Jobs() const {
  std::shared_lock lock(mutex_);
  return jobs_;
}

} // namespace macrelay::config
