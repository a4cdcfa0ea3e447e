#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace macrelay::jobs {

enum class JobType {
  kRefreshPortal,
  kRefreshEpg,
};

constexpr std::string_view ToString(JobType type) {
  return type == JobType::kRefreshPortal ? "refresh_portal" : "refresh_epg";
}

struct Job {
  JobType     type = JobType::kRefreshPortal;
  std::string portal_id; // empty for EPG
  std::string reason;

  // failed invocations so far
  std::uint32_t attempts = 0;

  std::chrono::steady_clock::time_point run_at{};
  std::uint64_t                         seq = 0;
};

enum class EnqueueState {
  kQueued,
  kRunning,
};

enum class RefreshState {
  kIdle,
  kQueued,
  kRunning,
  kCompleted,
  kError,
};

std::string_view ToString(RefreshState state);

struct PortalStats {
  std::int64_t total          = 0;
  std::int64_t total_channels = 0;
  std::int64_t channels       = 0;
  std::int64_t total_groups   = 0;
  std::int64_t groups         = 0;
};

struct MatchStatus {
  RefreshState                   state = RefreshState::kIdle;
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> completed_at;
  std::int64_t                   matched = 0;
  std::string                    error;
};

struct PortalRefreshStatus {
  RefreshState                   state = RefreshState::kIdle;
  std::optional<util::TimePoint> queued_at;
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> completed_at;
  std::string                    error;
  std::string                    reason;

  // invocations of the current job, retries included
  std::uint32_t attempts = 0;

  std::optional<PortalStats> stats;
  std::optional<MatchStatus> match;
};

// Last channel refresh across all portals, or the EPG refresh.
struct GlobalRefreshStatus {
  RefreshState                   state = RefreshState::kIdle;
  std::string                    portal_id;
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> completed_at;
  std::string                    error;
};

} // namespace macrelay::jobs
