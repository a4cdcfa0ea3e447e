#include "probe_executor.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/occupancy/occupancy_table.hpp"
#include "internal/portal/portal_store.hpp"
#include "internal/upstream/portal_client.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace macrelay::selection {

using namespace std::chrono_literals;
using observability::IntField;
using observability::StringField;

std::string_view ToString(ProbeFailure failure) {
  switch (failure) {
    case ProbeFailure::kNoFreeSlot:
      return "no_free_slot";
    case ProbeFailure::kAuthFailure:
      return "auth_failure";
    case ProbeFailure::kChannelResolution:
      return "channel_resolution";
    case ProbeFailure::kLinkResolution:
      return "link_resolution";
    case ProbeFailure::kLiveness:
      return "liveness";
    case ProbeFailure::kCancelled:
      return "cancelled";
    case ProbeFailure::kUpstreamError:
      return "upstream_error";
  }
  return "unknown";
}

bool ProbeResult::NoFreeCredential() const {
  if (success) return false;
  return std::all_of(failures.begin(), failures.end(), [](const ProbeAttempt& a) { return a.failure == ProbeFailure::kNoFreeSlot; });
}

ProbeExecutor::ProbeExecutor(std::shared_ptr<upstream::PortalClient> client, std::shared_ptr<occupancy::OccupancyTable> occupancy,
                             std::shared_ptr<portal::PortalStore> portals, process::SpawnFn spawn)
    : client_(std::move(client)), occupancy_(std::move(occupancy)), portals_(std::move(portals)), spawn_(std::move(spawn)) {
}

std::string ProbeExecutor::EmbeddedLink(const std::string& cmd) {
  const auto start = cmd.find(' ');
  if (start == std::string::npos) return {};

  const auto end = cmd.find(' ', start + 1);
  return cmd.substr(start + 1, end == std::string::npos ? std::string::npos : end - start - 1);
}

bool ProbeExecutor::NeedsLinkLookup(const std::string& cmd) {
  return cmd.find("http://localhost/") != std::string::npos;
}

ProbeResult ProbeExecutor::Run(const ProbeRequest& request, const std::vector<std::string>& candidates, const ProbeOptions& options) {
  ProbeResult result = options.parallel && candidates.size() > 1 ? RunParallel(request, candidates, options)
                                                                  : RunSequential(request, candidates, options);

  if (request.rotate_failures) RotateFailures(request, result.failures);
  return result;
}

ProbeResult ProbeExecutor::RunSequential(const ProbeRequest& request, const std::vector<std::string>& candidates, const ProbeOptions& options) {
  ProbeResult result;
  CancelToken never;

  for (const auto& mac : candidates) {
    auto probe = ProbeSingleMac(request, mac, options, never);
    if (probe.success) {
      result.success = std::move(probe.success);
      break;
    }

    result.failures.push_back({mac, probe.failure});
    if (!options.try_all_macs) break;
  }
  return result;
}

ProbeResult ProbeExecutor::RunParallel(const ProbeRequest& request, const std::vector<std::string>& candidates, const ProbeOptions& options) {
  const auto workers = std::max<std::size_t>(1, std::min(options.max_workers, candidates.size()));
  MACRELAY_LOG_INFO("Parallel MAC probing",
                    {IntField("workers", static_cast<std::int64_t>(workers)), IntField("candidates", static_cast<std::int64_t>(candidates.size())),
                     StringField("portal_id", request.portal.id)});

  std::mutex  mutex;
  std::size_t next = 0;
  ProbeResult result;
  CancelToken cancel;

  auto worker = [&] {
    for (;;) {
      std::string mac;
      {
        std::lock_guard lock(mutex);
        if (result.success || next >= candidates.size()) return;
        mac = candidates[next++];
      }

      auto probe = ProbeSingleMac(request, mac, options, cancel);

      std::lock_guard lock(mutex);
      // results arriving after the winner are discarded
      if (result.success) return;
      if (probe.success) {
        result.success = std::move(probe.success);
        cancel.Cancel();
        return;
      }
      result.failures.push_back({mac, probe.failure});
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) threads.emplace_back(worker);
  for (auto& t : threads) t.join();

  return result;
}

ProbeExecutor::MacProbe ProbeExecutor::ProbeSingleMac(const ProbeRequest& request, const std::string& mac, const ProbeOptions& options,
                                                      const CancelToken& cancel) {
  const auto started_at = util::SteadyClock::now();

  MacProbe probe;
  try {
    probe = ProbeSteps(request, mac, options, cancel);
  } catch (const std::exception& e) {
    MACRELAY_LOG_ERROR("Error probing MAC", {StringField("portal_id", request.portal.id), StringField("mac", mac), StringField("error", e.what())});
    probe.failure = ProbeFailure::kUpstreamError;
  }

  const auto outcome = probe.success ? std::string_view("success") : ToString(probe.failure);
  observability::Metrics::Instance().ObserveProbeDurationMs(outcome, util::MillisSince(started_at));

  if (!probe.success && probe.failure != ProbeFailure::kCancelled) {
    MACRELAY_LOG_DEBUG("MAC probe failed", {StringField("portal_id", request.portal.id), StringField("mac", mac), StringField("reason", outcome)});
  }
  return probe;
}

ProbeExecutor::MacProbe ProbeExecutor::ProbeSteps(const ProbeRequest& request, const std::string& mac, const ProbeOptions& options,
                                                  const CancelToken& cancel) {
  const auto& portal = request.portal;
  auto        fail   = [](ProbeFailure f) { return MacProbe{std::nullopt, f}; };

  if (request.enforce_capacity && portal.streams_per_mac != 0 && !occupancy_->HasFreeSlot(portal.id, mac, portal.streams_per_mac)) {
    return fail(ProbeFailure::kNoFreeSlot);
  }
  if (cancel.Cancelled()) return fail(ProbeFailure::kCancelled);

  MACRELAY_LOG_INFO("Trying MAC", {StringField("portal_id", portal.id), StringField("mac", mac), StringField("channel_id", request.channel_id)});

  auto token = client_->GetToken(portal.url, mac, portal.proxy);
  if (!token || token->empty()) return fail(ProbeFailure::kAuthFailure);
  if (cancel.Cancelled()) return fail(ProbeFailure::kCancelled);

  // keep-alive, the profile itself is not needed
  (void)client_->GetProfile(portal.url, mac, *token, portal.proxy);
  if (cancel.Cancelled()) return fail(ProbeFailure::kCancelled);

  std::string channel_name = request.channel_name;
  std::string cmd;
  if (request.cached_cmd && !request.cached_cmd->empty()) {
    cmd = *request.cached_cmd;
  } else {
    auto channels = client_->GetAllChannels(portal.url, mac, *token, portal.proxy);
    if (!channels || channels->empty()) return fail(ProbeFailure::kChannelResolution);

    std::vector<std::string> ids{request.channel_id};
    ids.insert(ids.end(), request.alternate_ids.begin(), request.alternate_ids.end());

    for (const auto& id : ids) {
      auto it = std::find_if(channels->begin(), channels->end(), [&](const upstream::UpstreamChannel& c) { return c.id == id; });
      if (it == channels->end() || it->cmd.empty()) continue;

      cmd = it->cmd;
      if (channel_name.empty()) channel_name = it->name;
      if (id != request.channel_id) {
        MACRELAY_LOG_INFO("Using alternate channel id", {StringField("channel_id", request.channel_id), StringField("alternate_id", id)});
      }
      break;
    }
  }
  if (cmd.empty()) return fail(ProbeFailure::kChannelResolution);
  if (cancel.Cancelled()) return fail(ProbeFailure::kCancelled);

  std::string link;
  if (NeedsLinkLookup(cmd)) {
    link = client_->GetLink(portal.url, mac, *token, cmd, portal.proxy).value_or("");
  } else {
    link = EmbeddedLink(cmd);
  }
  if (link.empty()) return fail(ProbeFailure::kLinkResolution);
  if (cancel.Cancelled()) return fail(ProbeFailure::kCancelled);

  if (options.test_streams) {
    bool cancelled = false;
    if (!TestStream(link, portal.proxy, options, cancel, &cancelled)) {
      return fail(cancelled ? ProbeFailure::kCancelled : ProbeFailure::kLiveness);
    }
  }

  return MacProbe{ProbeSuccess{mac, link, channel_name}, ProbeFailure::kUpstreamError};
}

bool ProbeExecutor::TestStream(const std::string& link, const std::string& proxy, const ProbeOptions& options, const CancelToken& cancel,
                               bool* cancelled) {
  std::vector<std::string> argv{options.ffprobe_path, "-timeout", std::to_string(options.ffmpeg_timeout.count() * 1000000LL)};
  if (!proxy.empty()) {
    argv.push_back("-http_proxy");
    argv.push_back(proxy);
  }
  argv.push_back("-i");
  argv.push_back(link);

  process::ProcessOptions popts;
  popts.capture_stdout    = false;
  popts.stderr_tail_lines = 8;

  std::unique_ptr<process::Process> probe;
  try {
    probe = spawn_(argv, std::move(popts));
  } catch (const util::ProcessError& e) {
    MACRELAY_LOG_WARN("Liveness probe could not start", {StringField("error", e.what())});
    return false;
  }

  // the probe's own -timeout covers connect; this bounds a stalled read
  const auto deadline = std::chrono::steady_clock::now() + std::max<std::chrono::milliseconds>(1s, options.ffmpeg_timeout * 2);
  for (;;) {
    if (auto code = probe->WaitFor(100ms)) {
      if (*code != 0) MACRELAY_LOG_DEBUG("Liveness probe failed", {IntField("exit_code", *code)});
      return *code == 0;
    }
    if (cancel.Cancelled()) {
      probe->Kill();
      probe->Wait();
      *cancelled = true;
      return false;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      MACRELAY_LOG_WARN("Liveness probe timed out", {StringField("link", link)});
      probe->Kill();
      probe->Wait();
      return false;
    }
  }
}

void ProbeExecutor::RotateFailures(const ProbeRequest& request, const std::vector<ProbeAttempt>& failures) {
  std::vector<std::string> macs;
  for (const auto& attempt : failures) {
    // cancelled siblings lost a race, they did not fail
    if (attempt.failure == ProbeFailure::kCancelled) continue;
    if (std::find(macs.begin(), macs.end(), attempt.mac) == macs.end()) macs.push_back(attempt.mac);
  }
  if (macs.empty()) return;

  try {
    portals_->MoveMacs(request.portal.id, macs);
  } catch (const util::NotFound& e) {
    MACRELAY_LOG_WARN("Portal vanished before MAC rotation", {StringField("portal_id", request.portal.id), StringField("error", e.what())});
  }
}

} // namespace macrelay::selection
