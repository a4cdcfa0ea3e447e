#include "stream_session.hpp"

#include <stdexcept>
#include <vector>

#include "command_template.hpp"
#include "internal/db/api/channel_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/portal/portal_store.hpp"
#include "internal/selection/mac_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace macrelay::streaming {

using model::SessionState;
using observability::IntField;
using observability::StringField;

std::string_view ToString(StreamOutcome outcome) {
  switch (outcome) {
    case StreamOutcome::kCompleted:
      return "completed";
    case StreamOutcome::kClientDisconnected:
      return "client_disconnected";
    case StreamOutcome::kProcessCrashed:
      return "process_crashed";
  }
  return "unknown";
}

StreamSession::StreamSession(StreamDeps deps, StreamRequest request, config::StreamingSettings settings)
    : deps_(std::move(deps)), request_(std::move(request)), settings_(std::move(settings)) {
}

StreamSession::~StreamSession() {
  Close();
}

void StreamSession::Transition(SessionState to) {
  if (!model::CanTransition(state_, to)) {
    throw std::logic_error("invalid session transition " + std::string(model::ToString(state_)) + " -> " + std::string(model::ToString(to)));
  }
  state_ = to;
}

bool StreamSession::IsRedirect() const {
  return !request_.web && settings_.stream_method != "ffmpeg";
}

void StreamSession::Acquire() {
  if (state_ != SessionState::kRequested) throw std::logic_error("stream session already acquired");

  auto portal = deps_.portals->Get(request_.portal_id);
  if (!portal) throw util::NotFound("portal not found: " + request_.portal_id);
  portal_ = std::move(*portal);

  MACRELAY_LOG_INFO("Stream requested", {StringField("client", request_.client_addr), StringField("portal_id", portal_.id),
                                         StringField("channel_id", request_.channel_id)});

  selection::ProbeRequest probe;
  probe.portal     = portal_;
  probe.channel_id = request_.channel_id;

  std::vector<std::string> available_macs;
  try {
    if (auto cached = deps_.channels->Get(portal_.id, request_.channel_id)) {
      available_macs      = cached->available_macs;
      probe.alternate_ids = cached->alternate_channel_ids;
      probe.cached_cmd    = cached->cached_cmd;
      probe.channel_name  = cached->name;
    }
  } catch (const std::exception& e) {
    MACRELAY_LOG_DEBUG("Channel cache lookup failed", {StringField("channel_id", request_.channel_id), StringField("error", e.what())});
  }

  const auto candidates = selection::RankCandidates(portal_, deps_.occupancy->Snapshot(portal_.id), available_macs);
  Transition(SessionState::kCredentialsScored);

  selection::ProbeOptions options;
  options.try_all_macs   = settings_.try_all_macs;
  options.parallel       = settings_.parallel_mac_probing;
  options.max_workers    = settings_.parallel_mac_workers;
  options.test_streams   = settings_.test_streams;
  options.ffmpeg_timeout = std::chrono::seconds(settings_.ffmpeg_timeout_seconds);
  options.ffprobe_path   = settings_.ffprobe_path;

  Transition(SessionState::kProbing);
  auto result = deps_.executor->Run(probe, candidates, options);

  if (!result.success) {
    Transition(SessionState::kExhausted);
    if (result.NoFreeCredential()) {
      MACRELAY_LOG_INFO("No free MAC", {StringField("portal_id", portal_.id), StringField("channel_id", request_.channel_id)});
      observability::Metrics::Instance().RecordStreamOutcome("no_free_credential");
      throw util::StreamUnavailable(util::UnavailableReason::kNoFreeCredential, "No streams available");
    }
    MACRELAY_LOG_INFO("No working streams found",
                      {StringField("portal_id", portal_.id), StringField("channel_id", request_.channel_id),
                       IntField("failed_macs", static_cast<std::int64_t>(result.failures.size()))});
    observability::Metrics::Instance().RecordStreamOutcome("no_working_stream");
    throw util::StreamUnavailable(util::UnavailableReason::kNoWorkingStream, "No streams available");
  }

  Transition(SessionState::kFound);
  mac_          = result.success->mac;
  link_         = result.success->link;
  channel_name_ = result.success->channel_name;

  if (IsRedirect()) {
    MACRELAY_LOG_INFO("Redirect sent", {StringField("portal_id", portal_.id), StringField("mac", mac_)});
    observability::Metrics::Instance().RecordStreamOutcome("redirect");
    return;
  }

  // visible to concurrent scorers before the process exists
  model::OccupiedSession session;
  session.portal_id    = portal_.id;
  session.mac          = mac_;
  session.channel_id   = request_.channel_id;
  session.channel_name = channel_name_;
  session.client_addr  = request_.client_addr;
  session.start_time   = util::Now();

  auto id = deps_.occupancy->TryOccupy(std::move(session), portal_.streams_per_mac);
  if (!id) {
    // a concurrent request took the last slot between probe and occupy
    Transition(SessionState::kExhausted);
    MACRELAY_LOG_INFO("No free MAC", {StringField("portal_id", portal_.id), StringField("mac", mac_), StringField("stage", "occupy")});
    observability::Metrics::Instance().RecordStreamOutcome("no_free_credential");
    throw util::StreamUnavailable(util::UnavailableReason::kNoFreeCredential, "No streams available");
  }
  occupancy_ = occupancy::OccupancyGuard(*deps_.occupancy, *id);
  Transition(SessionState::kOccupied);
}

std::vector<std::string> StreamSession::BuildCommand() const {
  const auto& tmpl = request_.web ? settings_.web_ffmpeg_command : settings_.ffmpeg_command;
  return ExpandCommandTemplate(tmpl, link_, std::chrono::seconds(settings_.ffmpeg_timeout_seconds), portal_.proxy);
}

StreamOutcome StreamSession::Relay(const ChunkSink& sink) {
  if (state_ != SessionState::kOccupied) throw std::logic_error("stream session is not ready to relay");

  process_ = deps_.spawn(BuildCommand(), process::ProcessOptions{});
  Transition(SessionState::kStreaming);

  std::vector<char> buffer(settings_.chunk_size_bytes);
  StreamOutcome     outcome = StreamOutcome::kCompleted;

  for (;;) {
    const auto n = process_->Read(buffer.data(), buffer.size());
    if (n == 0) {
      const auto code = process_->WaitFor(deps_.exit_grace);
      if (!code || *code != 0) {
        std::string tail;
        for (const auto& line : process_->StderrTail(8)) {
          if (!tail.empty()) tail += " | ";
          tail += line;
        }
        MACRELAY_LOG_INFO("Stream process closed with error, moving MAC",
                          {IntField("exit_code", code.value_or(-1)), StringField("portal_id", portal_.id), StringField("mac", mac_),
                           StringField("stderr_tail", tail)});
        deps_.portals->MoveMac(portal_.id, mac_);
        outcome = StreamOutcome::kProcessCrashed;
      }
      break;
    }

    if (!sink(std::string_view(buffer.data(), n))) {
      outcome = StreamOutcome::kClientDisconnected;
      break;
    }
  }

  MACRELAY_LOG_INFO("Stream ended", {StringField("portal_id", portal_.id), StringField("mac", mac_), StringField("outcome", ToString(outcome))});
  observability::Metrics::Instance().RecordStreamOutcome(ToString(outcome));
  Close();
  return outcome;
}

void StreamSession::Close() {
  if (state_ == SessionState::kClosed) return;

  if (process_) {
    if (process_->Running()) {
      process_->Kill();
      process_->Wait();
    }
    process_.reset();
  }

  if (occupancy_.Held()) {
    occupancy_.Release();
    state_ = SessionState::kUnoccupied;
  }
  state_ = SessionState::kClosed;
}

} // namespace macrelay::streaming
