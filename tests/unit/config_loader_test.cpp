#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/settings.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "macrelay_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestPortalsAndMacsStayStrings() {
  const auto yaml_path = WriteYaml("portals",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
portals:
  - id: "7"
    name: "Home"
    url: "http://portal.example.com/c/"
    proxy: "http://proxy:3128"
    streams_per_mac: 2
    auto_match: true
    macs:
      - mac: "00:1A:79:00:00:01"
        expiry: "December 31, 2027"
        watchdog_timeout_seconds: 120
      - mac: "00:1A:79:00:00:02"
)");

  auto config = macrelay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.portals_size() == 1);

  const auto& portal = config.portals(0);
  assert(portal.id() == "7");
  assert(portal.proxy() == "http://proxy:3128");
  assert(portal.streams_per_mac() == 2);
  assert(!portal.has_enabled());
  assert(portal.auto_match());
  assert(portal.macs_size() == 2);
  assert(portal.macs(0).mac() == "00:1A:79:00:00:01");
  assert(portal.macs(0).watchdog_timeout_seconds() == 120);
}

void TestDefaultsApply() {
  const auto yaml_path = WriteYaml("defaults", "logging:\n  level: debug\n");

  auto config = macrelay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");

  const auto streaming = macrelay::config::ResolveStreaming(config.streaming());
  assert(streaming.stream_method == "ffmpeg");
  assert(streaming.try_all_macs);
  assert(streaming.test_streams);
  assert(streaming.ffmpeg_timeout_seconds == 5);
  assert(streaming.parallel_mac_workers == 3);

  const auto hls = macrelay::config::ResolveHls(config.hls());
  assert(hls.max_streams == 10);
  assert(hls.inactive_timeout == std::chrono::seconds(30));

  const auto jobs = macrelay::config::ResolveJobs(config.jobs());
  assert(jobs.channel_refresh_interval_hours == 24);
  assert(jobs.epg_refresh_interval_hours == 0.5);
  assert(jobs.vacuum_channels_interval_hours == 0);
}

void TestExplicitFalseAndZeroOverrideDefaults() {
  const auto yaml_path = WriteYaml("overrides",
                                   R"(streaming:
  try_all_macs: false
  test_streams: false
  stream_method: redirect
hls:
  max_streams: 0
jobs:
  channel_refresh_interval_hours: 0
)");

  auto config = macrelay::config::ConfigLoader::LoadFromYaml(yaml_path.string());

  const auto streaming = macrelay::config::ResolveStreaming(config.streaming());
  assert(!streaming.try_all_macs);
  assert(!streaming.test_streams);
  assert(streaming.stream_method == "redirect");

  assert(macrelay::config::ResolveHls(config.hls()).max_streams == 0);
  assert(macrelay::config::ResolveJobs(config.jobs()).channel_refresh_interval_hours == 0);
}

void TestSettingsStoreReplace() {
  const auto first  = WriteYaml("reload_a", "jobs:\n  max_workers: 4\n");
  const auto second = WriteYaml("reload_b", "jobs:\n  max_workers: 1\nstreaming:\n  parallel_mac_probing: true\n");

  macrelay::config::SettingsStore store(macrelay::config::ConfigLoader::LoadFromYaml(first.string()));
  assert(store.Jobs().max_workers == 4);
  assert(!store.Streaming().parallel_mac_probing);

  store.Replace(macrelay::config::ConfigLoader::LoadFromYaml(second.string()));
  assert(store.Jobs().max_workers == 1);
  assert(store.Streaming().parallel_mac_probing);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)macrelay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestPortalWithoutIdIsRejected() {
  const auto yaml_path = WriteYaml("no_id",
                                   R"(portals:
  - name: "anonymous"
    url: "http://portal/c/"
)");

  bool threw = false;
  try {
    (void)macrelay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void ExpectRejected(const std::string& test_name, const std::string& yaml, const std::string& fragment) {
  const auto yaml_path = WriteYaml(test_name, yaml);

  bool threw = false;
  try {
    (void)macrelay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find(fragment) != std::string::npos;
  }
  assert(threw);
}

void TestPortalListIsValidated() {
  ExpectRejected("duplicate_id",
                 R"(portals:
  - id: "1"
    url: "http://a/c/"
  - id: "1"
    url: "http://b/c/"
)",
                 "duplicate portal id 1");

  ExpectRejected("no_url",
                 R"(portals:
  - id: "2"
    name: "nowhere"
)",
                 "portal 2 has no url");

  ExpectRejected("repeated_mac",
                 R"(portals:
  - id: "3"
    url: "http://c/c/"
    macs:
      - mac: "00:1A:79:00:00:09"
      - mac: "00:1A:79:00:00:09"
)",
                 "portal 3 has an empty or repeated MAC");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)macrelay::config::ConfigLoader::LoadFromYaml("/nonexistent/macrelay.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPortalsAndMacsStayStrings();
  TestDefaultsApply();
  TestExplicitFalseAndZeroOverrideDefaults();
  TestSettingsStoreReplace();
  TestUnknownFieldsAreRejected();
  TestPortalWithoutIdIsRejected();
  TestPortalListIsValidated();
  TestMissingFileIsReported();

  std::cout << "macrelay_unit_config_loader: pass\n";
  return 0;
}
