#include "hls_multiplexer.hpp"

#include <stdlib.h>

#include <cctype>
#include <filesystem>
#include <fstream>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace macrelay::hls {

namespace fs = std::filesystem;

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  out.close();
  return static_cast<bool>(out);
}

bool ContainsAny(std::string line, std::initializer_list<const char*> needles) {
  for (auto& c : line) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  for (const auto* n : needles) {
    if (line.find(n) != std::string::npos) return true;
  }
  return false;
}

} // namespace

HlsMultiplexer::HlsMultiplexer(HlsOptions options) : options_(std::move(options)) {
}

HlsMultiplexer::~HlsMultiplexer() {
  Stop();
}

std::string HlsMultiplexer::Key(const std::string& portal_id, const std::string& channel_id) {
  return portal_id + "_" + channel_id;
}

std::string HlsMultiplexer::MakeTempDir(const std::string& key) const {
  const fs::path root = options_.temp_root.empty() ? fs::temp_directory_path() : fs::path(options_.temp_root);
  fs::create_directories(root);

  std::string safe_key = key;
  for (auto& c : safe_key) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') c = '_';
  }

  std::string       pattern = (root / ("macrelay_hls_" + safe_key + "_XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');

  if (::mkdtemp(buffer.data()) == nullptr) {
    throw util::ProcessError("mkdtemp failed for " + pattern);
  }
  return std::string(buffer.data());
}

HlsSessionView HlsMultiplexer::View(Entry& entry) {
  HlsSessionView view;
  view.key           = entry.key;
  view.portal_id     = entry.portal_id;
  view.channel_id    = entry.channel_id;
  view.passthrough   = entry.passthrough;
  view.running       = entry.passthrough || (entry.process && entry.process->Running());
  view.temp_dir      = entry.temp_dir;
  view.created_at    = entry.created_at;
  view.last_accessed = entry.last_accessed;
  return view;
}

HlsSessionView HlsMultiplexer::StartStream(const std::string& portal_id, const std::string& channel_id, const std::string& source_link,
                                           const std::string& proxy) {
  const auto key = Key(portal_id, channel_id);

  std::lock_guard lock(mutex_);

  if (auto it = streams_.find(key); it != streams_.end()) {
    it->second->last_accessed = std::chrono::system_clock::now();
    it->second->last_touch    = SteadyClock::now();
    MACRELAY_LOG_INFO("Reusing HLS stream", {StringField("key", key)});
    return View(*it->second);
  }

  if (streams_.size() >= options_.max_streams) {
    MACRELAY_LOG_ERROR("Max concurrent HLS streams reached", {IntField("max_streams", static_cast<std::int64_t>(options_.max_streams))});
    throw util::AdmissionRejected("Maximum concurrent streams (" + std::to_string(options_.max_streams) + ") reached");
  }

  auto entry           = std::make_unique<Entry>();
  entry->key           = key;
  entry->portal_id     = portal_id;
  entry->channel_id    = channel_id;
  entry->source_link   = source_link;
  entry->passthrough   = IsHlsSource(source_link);
  entry->created_at    = std::chrono::system_clock::now();
  entry->last_accessed = entry->created_at;
  entry->last_touch    = SteadyClock::now();
  entry->temp_dir      = MakeTempDir(key);

  const fs::path master = fs::path(entry->temp_dir) / kMasterPlaylist;

  if (entry->passthrough) {
    if (!WriteFile(master, PassthroughMasterPlaylist(source_link))) {
      std::error_code ec;
      fs::remove_all(entry->temp_dir, ec);
      throw util::ProcessError("could not write master playlist for " + key);
    }
    MACRELAY_LOG_INFO("HLS passthrough ready", {StringField("key", key)});
  } else {
    const auto argv = BuildTranscodeCommand(options_.ffmpeg_path, source_link, proxy, options_.ffmpeg_timeout, options_.shape, entry->temp_dir);

    process::ProcessOptions popts;
    popts.capture_stdout = false;
    popts.on_stderr_line = [key](const std::string& line) {
      if (line.empty()) return;
      if (ContainsAny(line, {"error", "failed"})) {
        MACRELAY_LOG_ERROR("ffmpeg", {StringField("key", key), StringField("line", line)});
      } else if (ContainsAny(line, {"warning"})) {
        MACRELAY_LOG_WARN("ffmpeg", {StringField("key", key), StringField("line", line)});
      }
    };

    try {
      entry->process = options_.spawn(argv, std::move(popts));
    } catch (const std::exception& e) {
      MACRELAY_LOG_ERROR("Failed to start HLS stream", {StringField("key", key), StringField("error", e.what())});
      std::error_code ec;
      fs::remove_all(entry->temp_dir, ec);
      throw;
    }

    if (!WriteFile(master, TranscodeMasterPlaylist())) {
      MACRELAY_LOG_WARN("Failed to create master playlist", {StringField("key", key)});
    }
    MACRELAY_LOG_INFO("HLS transcode started", {StringField("key", key), IntField("pid", entry->process->Pid()), StringField("temp_dir", entry->temp_dir)});
  }

  auto view = View(*entry);
  streams_.emplace(key, std::move(entry));
  observability::Metrics::Instance().SetActiveSessions("hls", static_cast<std::int64_t>(streams_.size()));
  return view;
}

FileLookup HlsMultiplexer::GetFile(const std::string& portal_id, const std::string& channel_id, const std::string& filename) {
  if (filename.empty() || filename.find('/') != std::string::npos || filename.find("..") != std::string::npos) {
    throw util::InvalidArgument("invalid HLS file name: " + filename);
  }

  const auto key = Key(portal_id, channel_id);

  std::lock_guard lock(mutex_);

  FileLookup lookup;
  auto       it = streams_.find(key);
  if (it == streams_.end()) return lookup;

  auto& entry          = *it->second;
  entry.last_accessed  = std::chrono::system_clock::now();
  entry.last_touch     = SteadyClock::now();
  lookup.stream_active = true;
  lookup.passthrough   = entry.passthrough;

  const fs::path path = fs::path(entry.temp_dir) / filename;
  std::error_code ec;
  if (fs::exists(path, ec)) {
    lookup.path = path.string();
    return lookup;
  }

  if (!entry.passthrough && entry.process) {
    if (auto code = entry.process->Poll()) {
      lookup.process_exited = true;
      lookup.exit_code      = code;
      MACRELAY_LOG_ERROR("HLS process died", {StringField("key", key), IntField("exit_code", *code), StringField("missing", filename)});
    }
  }
  return lookup;
}

std::optional<HlsSessionView> HlsMultiplexer::Find(const std::string& portal_id, const std::string& channel_id) {
  std::lock_guard lock(mutex_);

  auto it = streams_.find(Key(portal_id, channel_id));
  if (it == streams_.end()) return std::nullopt;
  return View(*it->second);
}

std::vector<HlsSessionView> HlsMultiplexer::List() {
  std::lock_guard lock(mutex_);

  std::vector<HlsSessionView> out;
  out.reserve(streams_.size());
  for (auto& [key, entry] : streams_) out.push_back(View(*entry));
  return out;
}

std::size_t HlsMultiplexer::Size() const {
  std::lock_guard lock(mutex_);
  return streams_.size();
}

std::size_t HlsMultiplexer::ReapOnce() {
  std::vector<std::unique_ptr<Entry>> doomed;
  {
    std::lock_guard lock(mutex_);
    const auto      now = SteadyClock::now();

    for (auto it = streams_.begin(); it != streams_.end();) {
      auto& entry = *it->second;

      if (!entry.passthrough && entry.process) {
        if (auto code = entry.process->Poll()) {
          if (*code != 0) {
            std::string tail;
            for (const auto& line : entry.process->StderrTail(20)) tail += line + "\n";
            MACRELAY_LOG_ERROR("HLS process crashed", {StringField("key", entry.key), IntField("exit_code", *code), StringField("stderr", tail)});
          } else {
            MACRELAY_LOG_INFO("HLS process exited cleanly", {StringField("key", entry.key)});
          }
          doomed.push_back(std::move(it->second));
          it = streams_.erase(it);
          continue;
        }
      }

      const auto idle = now - entry.last_touch;
      if (idle > options_.inactive_timeout) {
        MACRELAY_LOG_INFO("Cleaning up inactive HLS stream",
                          {StringField("key", entry.key), BoolField("passthrough", entry.passthrough),
                           IntField("idle_ms", std::chrono::duration_cast<std::chrono::milliseconds>(idle).count())});
        doomed.push_back(std::move(it->second));
        it = streams_.erase(it);
        continue;
      }
      ++it;
    }
  }

  for (auto& entry : doomed) Destroy(std::move(entry));
  if (!doomed.empty()) PublishGauge();
  return doomed.size();
}

void HlsMultiplexer::Destroy(std::unique_ptr<Entry> entry) {
  if (entry->process && entry->process->Running()) {
    const auto code = entry->process->Stop(options_.stop_grace);
    MACRELAY_LOG_DEBUG("HLS process stopped", {StringField("key", entry->key), IntField("exit_code", code)});
  }
  entry->process.reset();

  std::error_code ec;
  fs::remove_all(entry->temp_dir, ec);
  if (ec) {
    MACRELAY_LOG_ERROR("Error removing HLS temp dir", {StringField("key", entry->key), StringField("error", ec.message())});
  }

  MACRELAY_LOG_INFO("HLS stream stopped", {StringField("key", entry->key), BoolField("passthrough", entry->passthrough)});
}

void HlsMultiplexer::PublishGauge() {
  observability::Metrics::Instance().SetActiveSessions("hls", static_cast<std::int64_t>(Size()));
}

void HlsMultiplexer::Start() {
  std::lock_guard lock(loop_mutex_);
  if (thread_.joinable()) return;

  stopping_ = false;
  thread_   = std::thread(&HlsMultiplexer::Loop, this);
  MACRELAY_LOG_INFO("HLS reaper started", {IntField("interval_ms", options_.reap_interval.count())});
}

void HlsMultiplexer::Loop() {
  std::unique_lock lock(loop_mutex_);
  while (!stopping_) {
    if (loop_cv_.wait_for(lock, options_.reap_interval, [&] { return stopping_; })) break;

    lock.unlock();
    try {
      ReapOnce();
    } catch (const std::exception& e) {
      MACRELAY_LOG_ERROR("Error in HLS reaper", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

void HlsMultiplexer::Stop() {
  {
    std::lock_guard lock(loop_mutex_);
    stopping_ = true;
  }
  loop_cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  std::map<std::string, std::unique_ptr<Entry>> remaining;
  {
    std::lock_guard lock(mutex_);
    remaining.swap(streams_);
  }
  if (remaining.empty()) return;

  MACRELAY_LOG_INFO("Cleaning up all HLS streams", {IntField("count", static_cast<std::int64_t>(remaining.size()))});
  for (auto& [key, entry] : remaining) Destroy(std::move(entry));
  PublishGauge();
}

} // namespace macrelay::hls
