#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "job.hpp"

namespace macrelay::portal {
class PortalLocks;
}

namespace macrelay::jobs {

/*
  Work the scheduler delegates. Any hook may throw; a throwing job is
  retried with backoff.
*/
struct JobHooks {
  // returns the number of channels fetched
  std::function<std::int64_t(const std::string& portal_id)> refresh_channels;
  std::function<PortalStats(const std::string& portal_id)>  compute_stats;

  // matching runs only when both are set and should_match agrees
  std::function<bool(const std::string& portal_id)>         should_match;
  std::function<std::int64_t(const std::string& portal_id)> run_matching;

  std::function<void()> refresh_epg;

  // drops derived output built from channel data
  std::function<void()> invalidate_guide;

  std::function<std::vector<std::string>()> enabled_portals;
};

struct SchedulerOptions {
  std::size_t   max_workers = 2;
  std::uint32_t max_retries = 2;

  // backoff = min(max_backoff, 2^attempts) * backoff_unit
  std::chrono::milliseconds backoff_unit{1000};
  std::uint32_t             max_backoff = 60;
};

/*
  Maintenance job queue.

  At most one queued-or-running job per (type, portal). Jobs wait in a
  min-heap ordered by run_at; workers start on demand up to max_workers.
  Portal jobs hold that portal's lock while running; EPG refreshes are
  globally serialized.
*/
class JobScheduler {
 public:
  JobScheduler(JobHooks hooks, std::shared_ptr<portal::PortalLocks> locks, SchedulerOptions options = {});
  ~JobScheduler();

  JobScheduler(const JobScheduler&)            = delete;
  JobScheduler& operator=(const JobScheduler&) = delete;

  EnqueueState EnqueueRefreshPortal(const std::string& portal_id, const std::string& reason = "manual");

  // One enqueue per enabled portal; returns how many are queued or running.
  std::size_t EnqueueRefreshAll(const std::string& reason = "scheduled");

  EnqueueState EnqueueEpgRefresh(const std::string& reason = "manual");

  PortalRefreshStatus GetPortalStatus(const std::string& portal_id) const;
  GlobalRefreshStatus ChannelsStatus() const;
  GlobalRefreshStatus EpgStatus() const;

  std::size_t QueuedCount() const;

  // Blocks until nothing is queued or running. False on timeout.
  bool WaitIdle(std::chrono::milliseconds timeout);

  // Finishes running jobs, drops the queue, joins the workers.
  void Stop();

  static std::chrono::milliseconds Backoff(std::uint32_t attempts, const SchedulerOptions& options);

 private:
  using Key = std::pair<JobType, std::string>;

  struct Later {
    bool operator()(const Job& a, const Job& b) const {
      return a.run_at != b.run_at ? a.run_at > b.run_at : a.seq > b.seq;
    }
  };

  EnqueueState EnqueueLocked(JobType type, const std::string& portal_id, const std::string& reason);
  void         EnsureWorkersLocked();
  void         Worker();

  // Returns the job to requeue when it failed and has retries left.
  std::optional<Job> Execute(const Job& job);
  void RefreshPortal(const Job& job);
  void RefreshEpg();
  bool ShouldMatch(const std::string& portal_id) const;
  void RunMatching(const std::string& portal_id);

  std::optional<Job> OnFailure(Job job, const std::string& error);
  void               RequeueLocked(Job job);

  JobHooks                             hooks_;
  std::shared_ptr<portal::PortalLocks> locks_;
  SchedulerOptions                     options_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::vector<Job>        heap_;
  std::set<Key>           queued_;
  std::set<Key>           in_flight_;
  std::uint64_t           next_seq_ = 0;
  bool                    stopping_ = false;

  std::vector<std::thread> workers_;

  std::mutex epg_mutex_;

  std::map<std::string, PortalRefreshStatus> portal_status_;
  GlobalRefreshStatus                        channels_status_;
  GlobalRefreshStatus                        epg_status_;
};

} // namespace macrelay::jobs
