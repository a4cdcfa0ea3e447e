#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/process/process.hpp"
#include "transcode_command.hpp"

namespace macrelay::hls {

struct HlsOptions {
  std::size_t               max_streams = 10;
  std::chrono::milliseconds inactive_timeout{30000};
  std::chrono::milliseconds reap_interval{10000};
  std::chrono::milliseconds stop_grace{5000};
  std::chrono::seconds      ffmpeg_timeout{5};
  SegmentShape              shape;

  // parent of the per-session temp directories; empty = system temp dir
  std::string temp_root;
  std::string ffmpeg_path{"ffmpeg"};

  process::SpawnFn spawn = process::DefaultSpawner();
};

struct HlsSessionView {
  std::string                           key;
  std::string                           portal_id;
  std::string                           channel_id;
  bool                                  passthrough = false;
  bool                                  running     = false;
  std::string                           temp_dir;
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point last_accessed{};
};

struct FileLookup {
  std::optional<std::string> path;
  bool                       stream_active  = false;
  bool                       passthrough    = false;
  bool                       process_exited = false;
  std::optional<int>         exit_code;
};

/*
  Shares one upstream pull per (portal, channel) between every HLS client.

  A source that is already HLS gets a passthrough entry: a master playlist
  pointing straight at the source, no process. Anything else gets a
  private temp directory and an ffmpeg process writing segments into it.

  The reaper removes entries whose process exited or that nobody touched
  for inactive_timeout. Removal (process stop, directory delete) happens
  outside the registry lock.
*/
class HlsMultiplexer {
 public:
  explicit HlsMultiplexer(HlsOptions options);
  ~HlsMultiplexer();

  HlsMultiplexer(const HlsMultiplexer&)            = delete;
  HlsMultiplexer& operator=(const HlsMultiplexer&) = delete;

  static std::string Key(const std::string& portal_id, const std::string& channel_id);

  // Reuses a live entry; throws util::AdmissionRejected at max_streams.
  HlsSessionView StartStream(const std::string& portal_id, const std::string& channel_id, const std::string& source_link, const std::string& proxy);

  // Touches the entry and resolves filename inside its directory.
  FileLookup GetFile(const std::string& portal_id, const std::string& channel_id, const std::string& filename);

  std::optional<HlsSessionView> Find(const std::string& portal_id, const std::string& channel_id);
  std::vector<HlsSessionView>   List();
  std::size_t                   Size() const;

  // One reaper pass; returns the number of entries removed.
  std::size_t ReapOnce();

  void Start();

  // Stops the reaper and every remaining entry.
  void Stop();

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Entry {
    std::string                           key;
    std::string                           portal_id;
    std::string                           channel_id;
    std::string                           source_link;
    bool                                  passthrough = false;
    std::string                           temp_dir;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_accessed{};
    SteadyClock::time_point               last_touch{};
    std::unique_ptr<process::Process>     process;
  };

  void Loop();
  void Destroy(std::unique_ptr<Entry> entry);
  void PublishGauge();

  std::string MakeTempDir(const std::string& key) const;

  static HlsSessionView View(Entry& entry);

  HlsOptions options_;

  mutable std::mutex                            mutex_;
  std::map<std::string, std::unique_ptr<Entry>> streams_;

  std::mutex              loop_mutex_;
  std::condition_variable loop_cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace macrelay::hls
