#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/config/settings.hpp"
#include "internal/model/portal.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/occupancy/occupancy_table.hpp"
#include "internal/process/process.hpp"
#include "internal/selection/probe_executor.hpp"

namespace macrelay::db {
class ChannelStore;
}
namespace macrelay::portal {
class PortalStore;
}

namespace macrelay::streaming {

struct StreamDeps {
  std::shared_ptr<portal::PortalStore>        portals;
  std::shared_ptr<db::ChannelStore>           channels;
  std::shared_ptr<occupancy::OccupancyTable>  occupancy;
  std::shared_ptr<selection::ProbeExecutor>   executor;
  process::SpawnFn                            spawn = process::DefaultSpawner();

  // how long to wait for an exit code after the output closes
  std::chrono::milliseconds exit_grace{2000};
};

struct StreamRequest {
  std::string portal_id;
  std::string channel_id;
  std::string client_addr;

  // fragmented MP4 for browsers
  bool web = false;
};

enum class StreamOutcome {
  kCompleted,
  kClientDisconnected,
  kProcessCrashed,
};

std::string_view ToString(StreamOutcome outcome);

// Returns false when the client is gone.
using ChunkSink = std::function<bool(std::string_view)>;

/*
  One direct-delivery request.

  Acquire() scores and probes credentials; on success the session holds
  an occupancy slot (ffmpeg mode) until it is destroyed. Relay() spawns
  the stream process and forwards its output in fixed-size chunks. A
  crash deprioritizes the MAC; the client has to re-request.

  Every exit path releases the slot and kills the process.
*/
class StreamSession {
 public:
  StreamSession(StreamDeps deps, StreamRequest request, config::StreamingSettings settings);
  ~StreamSession();

  StreamSession(const StreamSession&)            = delete;
  StreamSession& operator=(const StreamSession&) = delete;

  // Throws util::NotFound for an unknown portal, util::StreamUnavailable
  // when no credential produced a link.
  void Acquire();

  // stream_method other than ffmpeg hands the link to the client instead
  bool IsRedirect() const;

  StreamOutcome Relay(const ChunkSink& sink);

  const std::string& Mac() const {
    return mac_;
  }
  const std::string& Link() const {
    return link_;
  }
  const std::string& ChannelName() const {
    return channel_name_;
  }
  model::SessionState State() const {
    return state_;
  }

 private:
  void Transition(model::SessionState to);
  void Close();

  std::vector<std::string> BuildCommand() const;

  StreamDeps                 deps_;
  StreamRequest              request_;
  config::StreamingSettings  settings_;
  model::Portal              portal_;
  model::SessionState        state_ = model::SessionState::kRequested;

  std::string mac_;
  std::string link_;
  std::string channel_name_;

  occupancy::OccupancyGuard         occupancy_;
  std::unique_ptr<process::Process> process_;
};

} // namespace macrelay::streaming
