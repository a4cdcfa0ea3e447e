#pragma once

#include <chrono>
#include <memory>

#include "internal/process/process.hpp"

namespace macrelay::config {
class SettingsStore;
}
namespace macrelay::portal {
class PortalStore;
}
namespace macrelay::db {
class ChannelStore;
}
namespace macrelay::occupancy {
class OccupancyTable;
}
namespace macrelay::selection {
class ProbeExecutor;
}
namespace macrelay::hls {
class HlsMultiplexer;
}
namespace macrelay::jobs {
class JobScheduler;
}

namespace macrelay::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<config::SettingsStore>     settings;
  std::shared_ptr<portal::PortalStore>       portals;
  std::shared_ptr<db::ChannelStore>          channels;
  std::shared_ptr<occupancy::OccupancyTable> occupancy;
  std::shared_ptr<selection::ProbeExecutor>  executor;
  std::shared_ptr<hls::HlsMultiplexer>       hls;
  std::shared_ptr<jobs::JobScheduler>        scheduler;

  process::SpawnFn spawn = process::DefaultSpawner();

  // HLS file polling granularity
  std::chrono::milliseconds hls_poll_step{100};
};

} // namespace macrelay::service
