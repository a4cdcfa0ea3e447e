#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/channel_store.hpp"
#include "internal/db/memory/memory_channel_store.hpp"
#include "internal/epg/guide_cache.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/stream_server.hpp"
#include "internal/hls/hls_multiplexer.hpp"
#include "internal/jobs/channel_refresher.hpp"
#include "internal/jobs/job_scheduler.hpp"
#include "internal/jobs/refresh_timers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/occupancy/occupancy_table.hpp"
#include "internal/portal/portal_locks.hpp"
#include "internal/portal/portal_store.hpp"
#include "internal/selection/probe_executor.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/stream_service.hpp"
#include "internal/upstream/offline_portal_client.hpp"
#include "internal/util/time.hpp"
#if MACRELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_channel_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

namespace macrelay::factory {

using observability::IntField;
using observability::StringField;

namespace {

std::shared_ptr<db::ChannelStore> BuildChannelStore(const macrelay::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MACRELAY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    auto store     = std::make_shared<db::sqlite::SqliteChannelStore>(std::move(sqlite_db));
    store->Bootstrap();
    MACRELAY_LOG_INFO("Channel store ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return store;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  MACRELAY_LOG_INFO("Channel store ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryChannelStore>();
}

hls::HlsOptions BuildHlsOptions(const config::HlsSettings& hls, const config::StreamingSettings& streaming) {
  hls::HlsOptions options;
  options.max_streams             = hls.max_streams;
  options.inactive_timeout        = hls.inactive_timeout;
  options.reap_interval           = hls.reap_interval;
  options.ffmpeg_timeout          = std::chrono::seconds(streaming.ffmpeg_timeout_seconds);
  options.shape.segment_type      = hls.segment_type;
  options.shape.duration_seconds  = hls.segment_duration_seconds;
  options.shape.playlist_size     = hls.playlist_size;
  options.temp_root               = hls.temp_root;
  options.ffmpeg_path             = hls.ffmpeg_path;
  return options;
}

} // namespace

void Application::Stop() {
  if (timers) timers->Stop();
  if (scheduler) scheduler->Stop();
  if (hls) hls->Stop();
}

/*
  Wires stores, selection, streaming, HLS, jobs and timers, then the two
  gRPC services. Timers start here; the listener is started by the caller.
*/
Application Build(const macrelay::runtime::config::RuntimeConfig& config, std::shared_ptr<config::SettingsStore> settings) {
  Application app;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  auto locks    = std::make_shared<portal::PortalLocks>();
  auto portals  = portal::PortalStore::FromConfig(config, locks);
  auto channels = BuildChannelStore(config);

  MACRELAY_LOG_INFO("Portals loaded", {IntField("portals", static_cast<std::int64_t>(portals->List().size())),
                                       IntField("enabled", static_cast<std::int64_t>(portals->EnabledPortalIds().size()))});

  // ------------------------------------------------------------------
  // Stream engine
  // ------------------------------------------------------------------
  std::shared_ptr<upstream::PortalClient> client = std::make_shared<upstream::OfflinePortalClient>();

  auto occupancy = std::make_shared<occupancy::OccupancyTable>();
  auto executor  = std::make_shared<selection::ProbeExecutor>(client, occupancy, portals);

  app.hls = std::make_shared<hls::HlsMultiplexer>(BuildHlsOptions(config::ResolveHls(config.hls()), settings->Streaming()));
  app.hls->Start();

  // ------------------------------------------------------------------
  // Maintenance jobs
  // ------------------------------------------------------------------
  auto guide     = std::make_shared<epg::GuideCache>();
  auto refresher = std::make_shared<jobs::ChannelRefresher>(client, portals, channels);

  jobs::JobHooks hooks;
  hooks.refresh_channels = [refresher](const std::string& portal_id) { return refresher->Refresh(portal_id); };
  hooks.compute_stats    = [channels](const std::string& portal_id) {
    const auto      counts = channels->Stats(portal_id);
    jobs::PortalStats stats;
    stats.total_channels = static_cast<std::int64_t>(counts.total_channels);
    stats.channels       = static_cast<std::int64_t>(counts.enabled_channels);
    stats.total_groups   = static_cast<std::int64_t>(counts.total_groups);
    stats.groups         = static_cast<std::int64_t>(counts.enabled_groups);
    return stats;
  };
  hooks.refresh_epg      = [guide] { guide->MarkRefreshed(util::Now()); };
  hooks.invalidate_guide = [guide] { guide->Invalidate(); };
  hooks.enabled_portals  = [portals] { return portals->EnabledPortalIds(); };
  hooks.should_match     = [portals](const std::string& portal_id) {
    auto p = portals->Get(portal_id);
    return p && p->auto_match;
  };
  // TODO: wire run_matching once a channel-name matcher is linked; until then auto_match portals skip matching.

  const auto job_settings = settings->Jobs();

  jobs::SchedulerOptions scheduler_options;
  scheduler_options.max_workers = job_settings.max_workers;
  scheduler_options.max_retries = job_settings.max_retries;

  app.scheduler = std::make_shared<jobs::JobScheduler>(std::move(hooks), locks, scheduler_options);

  jobs::TimerHooks timer_hooks;
  timer_hooks.settings         = [settings] { return settings->Jobs(); };
  timer_hooks.refresh_channels = [scheduler = app.scheduler] { scheduler->EnqueueRefreshAll("scheduled"); };
  timer_hooks.refresh_epg      = [scheduler = app.scheduler] { scheduler->EnqueueEpgRefresh("scheduled"); };
  timer_hooks.vacuum           = [portals, channels] {
    std::vector<std::string> live;
    for (const auto& p : portals->List()) live.push_back(p.id);
    if (auto r = channels->Vacuum(live); !r) {
      throw std::runtime_error("channel vacuum failed: " + r.Describe());
    }
  };

  app.timers = std::make_shared<jobs::RefreshTimers>(std::move(timer_hooks));
  app.timers->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.settings  = settings;
  ctx.portals   = portals;
  ctx.channels  = channels;
  ctx.occupancy = occupancy;
  ctx.executor  = executor;
  ctx.hls       = app.hls;
  ctx.scheduler = app.scheduler;

  auto admin_service  = std::make_shared<service::AdminService>(ctx);
  auto stream_service = std::make_shared<service::StreamService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));
  app.grpc_services.push_back(std::make_unique<grpc::StreamServer>(stream_service));

  return app;
}

} // namespace macrelay::factory
