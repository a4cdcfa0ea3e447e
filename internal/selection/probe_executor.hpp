#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cancel_token.hpp"
#include "internal/model/portal.hpp"
#include "internal/process/process.hpp"

namespace macrelay::occupancy {
class OccupancyTable;
}
namespace macrelay::portal {
class PortalStore;
}
namespace macrelay::upstream {
class PortalClient;
}

namespace macrelay::selection {

enum class ProbeFailure {
  kNoFreeSlot,
  kAuthFailure,
  kChannelResolution,
  kLinkResolution,
  kLiveness,
  kCancelled,
  kUpstreamError,
};

std::string_view ToString(ProbeFailure failure);

struct ProbeRequest {
  model::Portal              portal;
  std::string                channel_id;
  std::vector<std::string>   alternate_ids;
  std::optional<std::string> cached_cmd;
  std::string                channel_name;

  // skip MACs without a free slot (direct delivery only)
  bool enforce_capacity = true;

  // deprioritize every MAC that failed once the round ends
  bool rotate_failures = true;
};

struct ProbeOptions {
  bool                 try_all_macs = true;
  bool                 parallel     = false;
  std::size_t          max_workers  = 3;
  bool                 test_streams = true;
  std::chrono::seconds ffmpeg_timeout{5};
  std::string          ffprobe_path{"ffprobe"};
};

struct ProbeSuccess {
  std::string mac;
  std::string link;
  std::string channel_name;
};

struct ProbeAttempt {
  std::string  mac;
  ProbeFailure failure;
};

struct ProbeResult {
  std::optional<ProbeSuccess> success;
  std::vector<ProbeAttempt>   failures;

  // true when no candidate had a free slot, as opposed to free MACs that
  // never produced a working link
  bool NoFreeCredential() const;
};

/*
  Walks an ordered MAC list until one yields a playable link.

  Sequential mode honours the candidate order and stops at the first
  success (or first failure when try_all_macs is off). Parallel mode runs
  up to max_workers probes at once, keeps the first success and cancels
  the rest between steps; an in-flight liveness check is killed. Failed
  MACs are rotated exactly once, after the round.
*/
class ProbeExecutor {
 public:
  ProbeExecutor(std::shared_ptr<upstream::PortalClient> client, std::shared_ptr<occupancy::OccupancyTable> occupancy,
                std::shared_ptr<portal::PortalStore> portals, process::SpawnFn spawn = process::DefaultSpawner());

  ProbeResult Run(const ProbeRequest& request, const std::vector<std::string>& candidates, const ProbeOptions& options);

  struct MacProbe {
    std::optional<ProbeSuccess> success;
    ProbeFailure                failure = ProbeFailure::kUpstreamError;
  };

  MacProbe ProbeSingleMac(const ProbeRequest& request, const std::string& mac, const ProbeOptions& options, const CancelToken& cancel);

  // "ffmpeg http://host/stream" -> "http://host/stream"; empty when the command carries no link.
  static std::string EmbeddedLink(const std::string& cmd);

  // Commands pointing at the portal's localhost need an extra GetLink call.
  static bool NeedsLinkLookup(const std::string& cmd);

 private:
  ProbeResult RunSequential(const ProbeRequest& request, const std::vector<std::string>& candidates, const ProbeOptions& options);
  ProbeResult RunParallel(const ProbeRequest& request, const std::vector<std::string>& candidates, const ProbeOptions& options);

  MacProbe ProbeSteps(const ProbeRequest& request, const std::string& mac, const ProbeOptions& options, const CancelToken& cancel);
  bool     TestStream(const std::string& link, const std::string& proxy, const ProbeOptions& options, const CancelToken& cancel, bool* cancelled);

  void RotateFailures(const ProbeRequest& request, const std::vector<ProbeAttempt>& failures);

  std::shared_ptr<upstream::PortalClient>    client_;
  std::shared_ptr<occupancy::OccupancyTable> occupancy_;
  std::shared_ptr<portal::PortalStore>       portals_;
  process::SpawnFn                           spawn_;
};

} // namespace macrelay::selection
