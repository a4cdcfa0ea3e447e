#include "internal/hls/hls_multiplexer.hpp"

#include <unistd.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using macrelay::hls::HlsMultiplexer;
using macrelay::hls::HlsOptions;
using macrelay::process::Process;
using macrelay::process::ProcessOptions;

struct Harness {
  fs::path                 root;
  std::vector<std::string> spawned;
  std::string              script = "sleep 30";

  Harness() {
    root = fs::temp_directory_path() / ("macrelay_hls_test_" + std::to_string(::getpid()));
    fs::remove_all(root);
  }

  ~Harness() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  HlsOptions Options(std::size_t max_streams = 10) {
    HlsOptions options;
    options.max_streams      = max_streams;
    options.inactive_timeout = 200ms;
    options.reap_interval    = 50ms;
    options.stop_grace       = 500ms;
    options.temp_root        = root.string();
    options.spawn            = [this](const std::vector<std::string>& argv, ProcessOptions popts) {
      spawned.push_back(argv.empty() ? "" : argv.front());
      return Process::Spawn({"/bin/sh", "-c", script}, std::move(popts));
    };
    return options;
  }
};

void Touch(const fs::path& path, const std::string& content = "x") {
  std::ofstream out(path);
  out << content;
}

void TestTranscodeSessionIsShared() {
  Harness        h;
  HlsMultiplexer mux(h.Options());

  auto first = mux.StartStream("p1", "100", "http://up/live.ts", "");
  assert(!first.passthrough);
  assert(first.running);
  assert(fs::exists(fs::path(first.temp_dir) / macrelay::hls::kMasterPlaylist));
  assert(first.temp_dir.rfind(h.root.string(), 0) == 0);

  auto second = mux.StartStream("p1", "100", "http://up/live.ts", "");
  assert(second.temp_dir == first.temp_dir);
  assert(h.spawned.size() == 1);
  assert(h.spawned.front() == "ffmpeg");
  assert(mux.Size() == 1);

  mux.Stop();
  assert(mux.Size() == 0);
  assert(!fs::exists(first.temp_dir));
}

void TestPassthroughNeedsNoProcess() {
  Harness        h;
  HlsMultiplexer mux(h.Options());

  auto view = mux.StartStream("p1", "200", "http://up/index.m3u8?token=1", "");
  assert(view.passthrough);
  assert(view.running);
  assert(h.spawned.empty());

  std::ifstream in(fs::path(view.temp_dir) / macrelay::hls::kMasterPlaylist);
  std::string   body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(body.find("http://up/index.m3u8?token=1") != std::string::npos);
}

void TestAdmissionLimit() {
  Harness        h;
  HlsMultiplexer mux(h.Options(1));

  mux.StartStream("p1", "100", "http://up/a.ts", "");

  bool rejected = false;
  try {
    mux.StartStream("p1", "101", "http://up/b.ts", "");
  } catch (const macrelay::util::AdmissionRejected& e) {
    rejected = true;
    assert(std::string(e.what()) == "Maximum concurrent streams (1) reached");
  }
  assert(rejected);

  // an existing key is still served at the limit
  mux.StartStream("p1", "100", "http://up/a.ts", "");
  assert(mux.Size() == 1);
}

void TestGetFileLookup() {
  Harness        h;
  HlsMultiplexer mux(h.Options());

  auto none = mux.GetFile("p1", "100", "stream.m3u8");
  assert(!none.stream_active);
  assert(!none.path);

  auto view = mux.StartStream("p1", "100", "http://up/a.ts", "");

  auto pending = mux.GetFile("p1", "100", "stream.m3u8");
  assert(pending.stream_active);
  assert(!pending.path);
  assert(!pending.process_exited);

  Touch(fs::path(view.temp_dir) / "stream.m3u8", "#EXTM3U\n");
  auto ready = mux.GetFile("p1", "100", "stream.m3u8");
  assert(ready.path);
  assert(*ready.path == (fs::path(view.temp_dir) / "stream.m3u8").string());

  for (const char* bad : {"", "../etc/passwd", "a/b.ts"}) {
    bool threw = false;
    try {
      mux.GetFile("p1", "100", bad);
    } catch (const macrelay::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestDeadProcessIsReportedAndReaped() {
  Harness h;
  h.script = "echo 'Server returned 404 Not Found' >&2; exit 1";
  HlsMultiplexer mux(h.Options());

  auto view = mux.StartStream("p1", "100", "http://up/a.ts", "");

  macrelay::hls::FileLookup lookup;
  for (int i = 0; i < 100; ++i) {
    lookup = mux.GetFile("p1", "100", "stream.m3u8");
    if (lookup.process_exited) break;
    std::this_thread::sleep_for(20ms);
  }
  assert(lookup.process_exited);
  assert(lookup.exit_code && *lookup.exit_code == 1);

  assert(mux.ReapOnce() == 1);
  assert(mux.Size() == 0);
  assert(!fs::exists(view.temp_dir));
}

void TestInactiveStreamsAreReaped() {
  Harness        h;
  HlsMultiplexer mux(h.Options());
  mux.Start();

  auto view = mux.StartStream("p1", "100", "http://up/a.ts", "");
  mux.StartStream("p1", "200", "http://up/index.m3u8", "");
  assert(mux.Size() == 2);

  // keep one of them warm past the timeout
  for (int i = 0; i < 10; ++i) {
    mux.GetFile("p1", "200", "master.m3u8");
    std::this_thread::sleep_for(50ms);
  }
  assert(!mux.Find("p1", "100"));
  assert(mux.Find("p1", "200"));
  assert(!fs::exists(view.temp_dir));

  auto listed = mux.List();
  assert(listed.size() == 1);
  assert(listed.front().key == HlsMultiplexer::Key("p1", "200"));

  mux.Stop();
}

} // namespace

int main() {
  TestTranscodeSessionIsShared();
  TestPassthroughNeedsNoProcess();
  TestAdmissionLimit();
  TestGetFileLookup();
  TestDeadProcessIsReportedAndReaped();
  TestInactiveStreamsAreReaped();

  std::cout << "macrelay_unit_hls_multiplexer: pass\n";
  return 0;
}
