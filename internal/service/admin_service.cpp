#include "admin_service.hpp"

#include <chrono>
#include <functional>

#include "internal/hls/hls_multiplexer.hpp"
#include "internal/jobs/job_scheduler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/occupancy/occupancy_table.hpp"
#include "internal/portal/portal_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "macrelay/v1.hpp"

namespace macrelay::service {

using namespace macrelay::v1;
using observability::StringField;

namespace {

RefreshState ToProto(jobs::RefreshState state) {
  switch (state) {
    case jobs::RefreshState::kIdle:
      return REFRESH_STATE_IDLE;
    case jobs::RefreshState::kQueued:
      return REFRESH_STATE_QUEUED;
    case jobs::RefreshState::kRunning:
      return REFRESH_STATE_RUNNING;
    case jobs::RefreshState::kCompleted:
      return REFRESH_STATE_COMPLETED;
    case jobs::RefreshState::kError:
      return REFRESH_STATE_ERROR;
  }
  return REFRESH_STATE_UNSPECIFIED;
}

EnqueueState ToProto(jobs::EnqueueState state) {
  return state == jobs::EnqueueState::kRunning ? ENQUEUE_STATE_RUNNING : ENQUEUE_STATE_QUEUED;
}

void SetTime(const std::optional<util::TimePoint>& tp, google::protobuf::Timestamp* out) {
  if (tp) *out = util::ToProto(*tp);
}

void FillGlobal(const jobs::GlobalRefreshStatus& in, GlobalRefreshStatus* out) {
  out->set_state(ToProto(in.state));
  out->set_portal_id(in.portal_id);
  SetTime(in.started_at, out->mutable_started_at());
  SetTime(in.completed_at, out->mutable_completed_at());
  out->set_error(in.error);
}

std::string DefaultReason(const std::string& reason) {
  return reason.empty() ? "manual" : reason;
}

// Shared metrics/logging wrapper for every admin RPC.
template <typename Fn>
auto Observed(std::string_view route, Fn&& fn) -> decltype(fn()) {
  const auto started_at = util::SteadyClock::now();

  try {
    auto resp = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, util::MillisSince(started_at));
    return resp;
  } catch (const std::exception& ex) {
    MACRELAY_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, util::MillisSince(started_at));
    throw;
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EnqueueResponse AdminService::EnqueueRefreshPortal(const EnqueueRefreshPortalRequest& req) {
  return Observed("AdminService.EnqueueRefreshPortal", [&] {
    if (req.portal_id().empty()) throw util::InvalidArgument("portal_id is required");
    if (!ctx_.portals->Get(req.portal_id())) throw util::NotFound("portal not found: " + req.portal_id());

    EnqueueResponse resp;
    resp.set_state(ToProto(ctx_.scheduler->EnqueueRefreshPortal(req.portal_id(), DefaultReason(req.reason()))));
    return resp;
  });
}

EnqueueRefreshAllResponse AdminService::EnqueueRefreshAll(const EnqueueRefreshAllRequest& req) {
  return Observed("AdminService.EnqueueRefreshAll", [&] {
    EnqueueRefreshAllResponse resp;
    resp.set_enqueued(static_cast<std::uint32_t>(ctx_.scheduler->EnqueueRefreshAll(DefaultReason(req.reason()))));
    return resp;
  });
}

EnqueueResponse AdminService::EnqueueEpgRefresh(const EnqueueEpgRefreshRequest& req) {
  return Observed("AdminService.EnqueueEpgRefresh", [&] {
    EnqueueResponse resp;
    resp.set_state(ToProto(ctx_.scheduler->EnqueueEpgRefresh(DefaultReason(req.reason()))));
    return resp;
  });
}

PortalStatus AdminService::GetPortalStatus(const GetPortalStatusRequest& req) {
  return Observed("AdminService.GetPortalStatus", [&] {
    if (!ctx_.portals->Get(req.portal_id())) throw util::NotFound("portal not found: " + req.portal_id());

    const auto status = ctx_.scheduler->GetPortalStatus(req.portal_id());

    PortalStatus resp;
    resp.set_portal_id(req.portal_id());
    resp.set_state(ToProto(status.state));
    SetTime(status.queued_at, resp.mutable_queued_at());
    SetTime(status.started_at, resp.mutable_started_at());
    SetTime(status.completed_at, resp.mutable_completed_at());
    resp.set_error(status.error);
    resp.set_reason(status.reason);
    resp.set_attempts(status.attempts);

    if (status.stats) {
      auto* stats = resp.mutable_stats();
      stats->set_total(static_cast<std::uint64_t>(status.stats->total));
      stats->set_total_channels(static_cast<std::uint64_t>(status.stats->total_channels));
      stats->set_channels(static_cast<std::uint64_t>(status.stats->channels));
      stats->set_total_groups(static_cast<std::uint64_t>(status.stats->total_groups));
      stats->set_groups(static_cast<std::uint64_t>(status.stats->groups));
    }

    if (status.match) {
      auto* match = resp.mutable_match();
      match->set_state(ToProto(status.match->state));
      SetTime(status.match->started_at, match->mutable_started_at());
      SetTime(status.match->completed_at, match->mutable_completed_at());
      match->set_matched(static_cast<std::uint64_t>(status.match->matched));
      match->set_error(status.match->error);
    }
    return resp;
  });
}

GetRefreshStatusResponse AdminService::GetRefreshStatus(const GetRefreshStatusRequest&) {
  return Observed("AdminService.GetRefreshStatus", [&] {
    GetRefreshStatusResponse resp;
    FillGlobal(ctx_.scheduler->ChannelsStatus(), resp.mutable_channels());
    FillGlobal(ctx_.scheduler->EpgStatus(), resp.mutable_epg());
    return resp;
  });
}

ListOccupancyResponse AdminService::ListOccupancy(const ListOccupancyRequest& req) {
  return Observed("AdminService.ListOccupancy", [&] {
    const auto sessions = req.portal_id().empty() ? ctx_.occupancy->SnapshotAll() : ctx_.occupancy->Snapshot(req.portal_id());

    ListOccupancyResponse resp;
    for (const auto& s : sessions) {
      auto* out = resp.add_sessions();
      out->set_portal_id(s.portal_id);
      out->set_mac(s.mac);
      out->set_channel_id(s.channel_id);
      out->set_channel_name(s.channel_name);
      out->set_client_addr(s.client_addr);
      *out->mutable_start_time() = util::ToProto(s.start_time);
    }
    return resp;
  });
}

ListHlsSessionsResponse AdminService::ListHlsSessions(const ListHlsSessionsRequest&) {
  return Observed("AdminService.ListHlsSessions", [&] {
    ListHlsSessionsResponse resp;
    for (const auto& s : ctx_.hls->List()) {
      auto* out = resp.add_sessions();
      out->set_key(s.key);
      out->set_portal_id(s.portal_id);
      out->set_channel_id(s.channel_id);
      out->set_passthrough(s.passthrough);
      out->set_running(s.running);
      out->set_temp_dir(s.temp_dir);
      *out->mutable_created_at()    = util::ToProto(s.created_at);
      *out->mutable_last_accessed() = util::ToProto(s.last_accessed);
    }
    return resp;
  });
}

} // namespace macrelay::service
