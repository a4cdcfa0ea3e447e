#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

namespace {

using macrelay::observability::IntField;
using macrelay::observability::StringField;

volatile std::sig_atomic_t g_stop   = 0;
volatile std::sig_atomic_t g_reload = 0;

struct Options {
  std::string config_path;
  bool        check_only = false;
};

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      opts.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (opts.config_path.empty() && arg.rfind("--", 0) != 0) {
      opts.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (opts.config_path.empty()) return std::nullopt;
  return opts;
}

// SIGHUP: portals, MACs and tuning come from the file again; the listener and cache path do not.
void ReloadSettings(const std::string& path, macrelay::config::SettingsStore& settings) {
  try {
    auto config = macrelay::config::ConfigLoader::LoadFromYaml(path);
    macrelay::observability::ApplyLoggingSettings(config);
    settings.Replace(config);
    MACRELAY_LOG_INFO("Settings reloaded", {StringField("config", path), IntField("portals", config.portals_size())});
  } catch (const std::exception& e) {
    MACRELAY_LOG_ERROR("Settings reload failed, keeping previous settings", {StringField("config", path), StringField("error", e.what())});
  }
}

int RunGateway(const Options& opts) {
  auto config = macrelay::config::ConfigLoader::LoadFromYaml(opts.config_path);

  macrelay::observability::InitializeLogging(config);
  macrelay::observability::InitializeMetrics(config);

  auto settings = std::make_shared<macrelay::config::SettingsStore>(config);
  auto app      = macrelay::factory::Build(config, settings);

  macrelay::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

  std::signal(SIGINT, [](int) { g_stop = 1; });
  std::signal(SIGTERM, [](int) { g_stop = 1; });
  std::signal(SIGHUP, [](int) { g_reload = 1; });
  // ffmpeg pipes close under us whenever a child exits
  std::signal(SIGPIPE, SIG_IGN);

  server.Start();
  MACRELAY_LOG_INFO("macrelay started", {StringField("config", opts.config_path), IntField("portals", config.portals_size())});

  while (!g_stop) {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    if (g_reload) {
      g_reload = 0;
      ReloadSettings(opts.config_path, *settings);
    }
  }

  MACRELAY_LOG_INFO("Shutting down macrelay");
  server.Stop();
  app.Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto opts = ParseArgs(argc, argv);
  if (!opts) {
    std::cerr << "Usage: macrelay [--check-config] [--config] <config.yaml>" << std::endl;
    return 1;
  }

  if (opts->check_only) {
    try {
      const auto config = macrelay::config::ConfigLoader::LoadFromYaml(opts->config_path);
      std::cout << opts->config_path << ": ok, " << config.portals_size() << " portal(s)" << std::endl;
      return 0;
    } catch (const std::exception& e) {
      std::cerr << e.what() << std::endl;
      return 2;
    }
  }

  int rc = 0;
  try {
    rc = RunGateway(*opts);
  } catch (const std::exception& e) {
    MACRELAY_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    std::cerr << "macrelay: " << e.what() << std::endl;
    rc = 2;
  }

  macrelay::observability::ShutdownMetrics();
  macrelay::observability::ShutdownLogging();
  return rc;
}
