#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace macrelay::config {
class SettingsStore;
}
namespace macrelay::hls {
class HlsMultiplexer;
}
namespace macrelay::jobs {
class JobScheduler;
class RefreshTimers;
}

namespace macrelay::factory {

/*
  Everything the daemon keeps alive for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<hls::HlsMultiplexer> hls;
  std::shared_ptr<jobs::JobScheduler>  scheduler;
  std::shared_ptr<jobs::RefreshTimers> timers;

  // timers first so nothing new is queued, then jobs, then HLS processes
  void Stop();
};

/*
  Composition root. The only place that knows the concrete store and
  upstream client types.
*/
Application Build(const macrelay::runtime::config::RuntimeConfig& config, std::shared_ptr<config::SettingsStore> settings);

} // namespace macrelay::factory
