#include "stream_service.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

#include "internal/config/settings.hpp"
#include "internal/db/api/channel_store.hpp"
#include "internal/hls/hls_multiplexer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/occupancy/occupancy_table.hpp"
#include "internal/portal/portal_store.hpp"
#include "internal/selection/mac_scorer.hpp"
#include "internal/selection/probe_executor.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "macrelay/v1.hpp"

namespace macrelay::service {

using namespace macrelay::v1;
using observability::IntField;
using observability::StringField;

namespace {

constexpr int kTranscodePlaylistSteps   = 100;
constexpr int kPassthroughPlaylistSteps = 10;
constexpr int kSegmentSteps             = 30;

void RecordOutcome(std::string_view route, bool success, util::SteadyTimePoint started_at) {
  observability::Metrics::Instance().RecordRequest(route, success);
  observability::Metrics::Instance().ObserveRequestLatencyMs(route, util::MillisSince(started_at));
}

bool EndsWith(const std::string& s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string ReadWholeFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::FileNotReady("cannot open " + path);

  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

} // namespace

StreamService::StreamService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

streaming::StreamOutcome StreamService::Play(const PlayRequest& req, const PlayWriter& write) {
  const auto started_at = util::SteadyClock::now();

  try {
    if (req.portal_id().empty() || req.channel_id().empty()) {
      throw util::InvalidArgument("portal_id and channel_id are required");
    }

    streaming::StreamDeps deps;
    deps.portals   = ctx_.portals;
    deps.channels  = ctx_.channels;
    deps.occupancy = ctx_.occupancy;
    deps.executor  = ctx_.executor;
    deps.spawn     = ctx_.spawn;

    streaming::StreamRequest request;
    request.portal_id   = req.portal_id();
    request.channel_id  = req.channel_id();
    request.client_addr = req.client_addr();
    request.web         = req.web();

    streaming::StreamSession session(std::move(deps), std::move(request), ctx_.settings->Streaming());
    session.Acquire();

    if (session.IsRedirect()) {
      PlayChunk chunk;
      chunk.set_redirect_url(session.Link());
      chunk.set_channel_name(session.ChannelName());
      RecordOutcome("StreamService.Play", true, started_at);
      return write(chunk) ? streaming::StreamOutcome::kCompleted : streaming::StreamOutcome::kClientDisconnected;
    }

    bool first   = true;
    auto outcome = session.Relay([&](std::string_view data) {
      PlayChunk chunk;
      chunk.set_data(data.data(), data.size());
      if (first) {
        chunk.set_channel_name(session.ChannelName());
        first = false;
      }
      return write(chunk);
    });

    RecordOutcome("StreamService.Play", outcome != streaming::StreamOutcome::kProcessCrashed, started_at);
    return outcome;
  } catch (const std::exception& ex) {
    MACRELAY_LOG_ERROR("RPC failed", {StringField("route", "StreamService.Play"), StringField("error", ex.what())});
    RecordOutcome("StreamService.Play", false, started_at);
    throw;
  }
}

std::string StreamService::ResolveHlsSource(const std::string& portal_id, const std::string& channel_id, std::string* proxy) {
  auto portal = ctx_.portals->Get(portal_id);
  if (!portal) throw util::NotFound("portal not found: " + portal_id);
  *proxy = portal->proxy;

  selection::ProbeRequest probe;
  probe.portal           = *portal;
  probe.channel_id       = channel_id;
  probe.enforce_capacity = false;
  probe.rotate_failures  = false;

  std::vector<std::string> available_macs;
  if (auto cached = ctx_.channels->Get(portal_id, channel_id)) {
    available_macs      = cached->available_macs;
    probe.alternate_ids = cached->alternate_channel_ids;
    probe.cached_cmd    = cached->cached_cmd;
    probe.channel_name  = cached->name;
  }

  const auto settings = ctx_.settings->Streaming();

  selection::ProbeOptions options;
  options.try_all_macs   = settings.try_all_macs;
  options.parallel       = settings.parallel_mac_probing;
  options.max_workers    = settings.parallel_mac_workers;
  options.test_streams   = false;
  options.ffmpeg_timeout = std::chrono::seconds(settings.ffmpeg_timeout_seconds);
  options.ffprobe_path   = settings.ffprobe_path;

  const auto candidates = selection::RankCandidates(*portal, ctx_.occupancy->Snapshot(portal_id), available_macs);
  auto       result     = ctx_.executor->Run(probe, candidates, options);
  if (!result.success) {
    MACRELAY_LOG_INFO("No HLS source found", {StringField("portal_id", portal_id), StringField("channel_id", channel_id)});
    throw util::StreamUnavailable(util::UnavailableReason::kNoWorkingStream, "No streams available");
  }
  return result.success->link;
}

GetHlsFileResponse StreamService::GetHlsFile(const GetHlsFileRequest& req) {
  const auto started_at = util::SteadyClock::now();

  try {
    if (req.portal_id().empty() || req.channel_id().empty() || req.filename().empty()) {
      throw util::InvalidArgument("portal_id, channel_id and filename are required");
    }

    if (!ctx_.hls->Find(req.portal_id(), req.channel_id())) {
      std::string proxy;
      const auto  link = ResolveHlsSource(req.portal_id(), req.channel_id(), &proxy);
      ctx_.hls->StartStream(req.portal_id(), req.channel_id(), link, proxy);
    }

    const bool playlist = EndsWith(req.filename(), ".m3u8");

    for (int step = 0;; ++step) {
      const auto lookup = ctx_.hls->GetFile(req.portal_id(), req.channel_id(), req.filename());

      if (lookup.path) {
        GetHlsFileResponse resp;
        resp.set_content(ReadWholeFile(*lookup.path));
        resp.set_mime_type(hls::MimeTypeFor(req.filename()));
        resp.set_passthrough(lookup.passthrough);
        RecordOutcome("StreamService.GetHlsFile", true, started_at);
        return resp;
      }

      if (!lookup.stream_active) {
        throw util::FileNotReady("HLS stream is gone");
      }
      if (lookup.process_exited) {
        throw util::FileNotReady("HLS process exited with code " + std::to_string(lookup.exit_code.value_or(-1)));
      }

      const int steps = !playlist ? kSegmentSteps : (lookup.passthrough ? kPassthroughPlaylistSteps : kTranscodePlaylistSteps);
      if (step + 1 >= steps) {
        MACRELAY_LOG_WARN("HLS file not ready", {StringField("file", req.filename()), IntField("waited_ms", step * ctx_.hls_poll_step.count())});
        throw util::FileNotReady("file not ready: " + req.filename());
      }
      std::this_thread::sleep_for(ctx_.hls_poll_step);
    }
  } catch (const std::exception& ex) {
    MACRELAY_LOG_ERROR("RPC failed", {StringField("route", "StreamService.GetHlsFile"), StringField("error", ex.what())});
    RecordOutcome("StreamService.GetHlsFile", false, started_at);
    throw;
  }
}

} // namespace macrelay::service
