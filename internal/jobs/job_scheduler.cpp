#include "job_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/portal/portal_locks.hpp"

namespace macrelay::jobs {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

std::string_view ToString(RefreshState state) {
  switch (state) {
    case RefreshState::kIdle:
      return "idle";
    case RefreshState::kQueued:
      return "queued";
    case RefreshState::kRunning:
      return "running";
    case RefreshState::kCompleted:
      return "completed";
    case RefreshState::kError:
      return "error";
  }
  return "unknown";
}

JobScheduler::JobScheduler(JobHooks hooks, std::shared_ptr<portal::PortalLocks> locks, SchedulerOptions options)
    : hooks_(std::move(hooks)), locks_(std::move(locks)), options_(options) {
  if (!locks_) {
    throw std::invalid_argument("JobScheduler: portal locks required");
  }
  if (options_.max_workers == 0) {
    options_.max_workers = 1;
  }
}

JobScheduler::~JobScheduler() {
  Stop();
}

std::chrono::milliseconds JobScheduler::Backoff(std::uint32_t attempts, const SchedulerOptions& options) {
  std::uint64_t factor = options.max_backoff;
  if (attempts < 32) {
    factor = std::min<std::uint64_t>(options.max_backoff, std::uint64_t{1} << attempts);
  }
  return options.backoff_unit * static_cast<std::int64_t>(factor);
}

// ---------------------------------------------------------------------------
// Enqueue
// ---------------------------------------------------------------------------

EnqueueState JobScheduler::EnqueueLocked(JobType type, const std::string& portal_id, const std::string& reason) {
  Key key{type, portal_id};

  if (in_flight_.count(key)) {
    return EnqueueState::kRunning;
  }
  if (queued_.count(key)) {
    return EnqueueState::kQueued;
  }

  Job job;
  job.type      = type;
  job.portal_id = portal_id;
  job.reason    = reason;
  job.run_at    = std::chrono::steady_clock::now();
  job.seq       = next_seq_++;

  heap_.push_back(std::move(job));
  std::push_heap(heap_.begin(), heap_.end(), Later{});
  queued_.insert(std::move(key));

  EnsureWorkersLocked();
  cv_.notify_one();
  return EnqueueState::kQueued;
}

void JobScheduler::EnsureWorkersLocked() {
  if (stopping_) {
    return;
  }
  while (workers_.size() < options_.max_workers && workers_.size() < heap_.size() + in_flight_.size()) {
    workers_.emplace_back([this] { Worker(); });
  }
}

EnqueueState JobScheduler::EnqueueRefreshPortal(const std::string& portal_id, const std::string& reason) {
  std::lock_guard lock(mutex_);

  const EnqueueState result = EnqueueLocked(JobType::kRefreshPortal, portal_id, reason);
  if (result == EnqueueState::kRunning) {
    return result;
  }

  auto& status = portal_status_[portal_id];
  if (status.state != RefreshState::kQueued) {
    status           = PortalRefreshStatus{};
    status.state     = RefreshState::kQueued;
    status.queued_at = util::Now();
    status.reason    = reason;
    if (ShouldMatch(portal_id)) {
      MatchStatus match;
      match.state  = RefreshState::kQueued;
      status.match = match;
    }
  }

  MACRELAY_LOG_INFO("Queued portal refresh", {StringField("portal_id", portal_id), StringField("reason", reason)});
  return result;
}

std::size_t JobScheduler::EnqueueRefreshAll(const std::string& reason) {
  const auto portals = hooks_.enabled_portals ? hooks_.enabled_portals() : std::vector<std::string>{};

  std::size_t count = 0;
  for (const auto& id : portals) {
    EnqueueRefreshPortal(id, reason);
    ++count;
  }

  MACRELAY_LOG_INFO("Queued refresh for all portals",
                    {IntField("portals", static_cast<std::int64_t>(count)), StringField("reason", reason)});
  return count;
}

EnqueueState JobScheduler::EnqueueEpgRefresh(const std::string& reason) {
  std::lock_guard lock(mutex_);
  const EnqueueState result = EnqueueLocked(JobType::kRefreshEpg, "", reason);
  if (result == EnqueueState::kQueued && epg_status_.state != RefreshState::kQueued) {
    epg_status_.state = RefreshState::kQueued;
    epg_status_.error.clear();
  }
  return result;
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

PortalRefreshStatus JobScheduler::GetPortalStatus(const std::string& portal_id) const {
  std::lock_guard lock(mutex_);
  auto            it = portal_status_.find(portal_id);
  return it == portal_status_.end() ? PortalRefreshStatus{} : it->second;
}

GlobalRefreshStatus JobScheduler::ChannelsStatus() const {
  std::lock_guard lock(mutex_);
  return channels_status_;
}

GlobalRefreshStatus JobScheduler::EpgStatus() const {
  std::lock_guard lock(mutex_);
  return epg_status_;
}

std::size_t JobScheduler::QueuedCount() const {
  std::lock_guard lock(mutex_);
  return heap_.size();
}

bool JobScheduler::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return heap_.empty() && in_flight_.empty(); });
}

void JobScheduler::Stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard lock(mutex_);
    if (stopping_ && workers_.empty()) {
      return;
    }
    stopping_ = true;
    workers.swap(workers_);
  }
  cv_.notify_all();

  for (auto& t : workers) {
    if (t.joinable()) {
      t.join();
    }
  }

  std::lock_guard lock(mutex_);
  heap_.clear();
  queued_.clear();
  idle_cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

void JobScheduler::Worker() {
  std::unique_lock lock(mutex_);

  while (!stopping_) {
    if (heap_.empty()) {
      cv_.wait(lock, [this] { return stopping_ || !heap_.empty(); });
      continue;
    }

    const auto run_at = heap_.front().run_at;
    if (run_at > std::chrono::steady_clock::now()) {
      cv_.wait_until(lock, run_at);
      continue;
    }

    std::pop_heap(heap_.begin(), heap_.end(), Later{});
    Job job = std::move(heap_.back());
    heap_.pop_back();

    Key key{job.type, job.portal_id};
    queued_.erase(key);
    in_flight_.insert(key);

    lock.unlock();
    auto retry = Execute(job);
    lock.lock();

    // the key leaves in_flight_ and enters queued_ under one lock hold
    in_flight_.erase(key);
    if (retry && !stopping_) RequeueLocked(std::move(*retry));

    if (heap_.empty() && in_flight_.empty()) {
      idle_cv_.notify_all();
    }
  }
}

std::optional<Job> JobScheduler::Execute(const Job& job) {
  const std::string type{ToString(job.type)};

  try {
    if (job.type == JobType::kRefreshPortal) {
      auto                        portal_mutex = locks_->For(job.portal_id);
      std::lock_guard<std::mutex> portal_lock(*portal_mutex);
      RefreshPortal(job);
    } else {
      std::lock_guard<std::mutex> epg_lock(epg_mutex_);
      RefreshEpg();
    }
    observability::Metrics::Instance().RecordJob(type, true);
    return std::nullopt;
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordJob(type, false);
    return OnFailure(job, e.what());
  }
}

std::optional<Job> JobScheduler::OnFailure(Job job, const std::string& error) {
  job.attempts++;

  std::lock_guard lock(mutex_);

  if (job.attempts <= options_.max_retries && !stopping_) {
    const auto delay = Backoff(job.attempts, options_);

    MACRELAY_LOG_ERROR("Job failed, retrying",
                       {StringField("type", ToString(job.type)),
                        StringField("portal_id", job.portal_id),
                        IntField("attempt", job.attempts),
                        IntField("backoff_ms", delay.count()),
                        StringField("error", error)});

    if (job.type == JobType::kRefreshPortal) {
      auto& status  = portal_status_[job.portal_id];
      status.state  = RefreshState::kQueued;
      status.error  = error;
    } else {
      epg_status_.state = RefreshState::kQueued;
      epg_status_.error = error;
    }

    job.run_at = std::chrono::steady_clock::now() + delay;
    return job;
  }

  MACRELAY_LOG_ERROR("Job failed permanently",
                     {StringField("type", ToString(job.type)),
                      StringField("portal_id", job.portal_id),
                      IntField("attempts", job.attempts),
                      StringField("error", error)});

  const auto now = util::Now();
  if (job.type == JobType::kRefreshPortal) {
    auto& status        = portal_status_[job.portal_id];
    status.state        = RefreshState::kError;
    status.error        = error;
    status.completed_at = now;

    channels_status_.state        = RefreshState::kError;
    channels_status_.portal_id    = job.portal_id;
    channels_status_.error        = error;
    channels_status_.completed_at = now;
  } else {
    epg_status_.state        = RefreshState::kError;
    epg_status_.error        = error;
    epg_status_.completed_at = now;
  }
  return std::nullopt;
}

void JobScheduler::RequeueLocked(Job job) {
  job.seq = next_seq_++;
  queued_.insert(Key{job.type, job.portal_id});
  heap_.push_back(std::move(job));
  std::push_heap(heap_.begin(), heap_.end(), Later{});
  cv_.notify_one();
}

// ---------------------------------------------------------------------------
// Job bodies
// ---------------------------------------------------------------------------

void JobScheduler::RefreshPortal(const Job& job) {
  const auto& portal_id = job.portal_id;

  {
    std::lock_guard lock(mutex_);
    const auto      now = util::Now();

    auto& status      = portal_status_[portal_id];
    status.state      = RefreshState::kRunning;
    status.started_at = now;
    status.reason     = job.reason;
    status.attempts   = job.attempts + 1;

    channels_status_.state        = RefreshState::kRunning;
    channels_status_.portal_id    = portal_id;
    channels_status_.started_at   = now;
    channels_status_.completed_at.reset();
    channels_status_.error.clear();
  }

  MACRELAY_LOG_INFO("Refreshing portal channels",
                    {StringField("portal_id", portal_id), StringField("reason", job.reason)});

  if (hooks_.invalidate_guide) {
    hooks_.invalidate_guide();
  }

  const std::int64_t total = hooks_.refresh_channels ? hooks_.refresh_channels(portal_id) : 0;

  PortalStats stats = hooks_.compute_stats ? hooks_.compute_stats(portal_id) : PortalStats{};
  stats.total       = total;

  {
    std::lock_guard lock(mutex_);
    const auto      now = util::Now();

    auto& status        = portal_status_[portal_id];
    status.state        = RefreshState::kCompleted;
    status.completed_at = now;
    status.error.clear();
    status.stats = stats;

    channels_status_.state        = RefreshState::kCompleted;
    channels_status_.completed_at = now;
  }

  MACRELAY_LOG_INFO("Portal refresh completed",
                    {StringField("portal_id", portal_id),
                     IntField("total", total),
                     IntField("channels", stats.channels),
                     IntField("groups", stats.groups)});

  if (ShouldMatch(portal_id)) {
    RunMatching(portal_id);
  }

  EnqueueEpgRefresh("portal_refresh");
}

bool JobScheduler::ShouldMatch(const std::string& portal_id) const {
  return hooks_.run_matching && hooks_.should_match && hooks_.should_match(portal_id);
}

void JobScheduler::RunMatching(const std::string& portal_id) {
  {
    std::lock_guard lock(mutex_);
    MatchStatus     match;
    match.state                        = RefreshState::kRunning;
    match.started_at                   = util::Now();
    portal_status_[portal_id].match = match;
  }

  try {
    const std::int64_t matched = hooks_.run_matching(portal_id);

    std::lock_guard lock(mutex_);
    auto&           match = *portal_status_[portal_id].match;
    match.state           = RefreshState::kCompleted;
    match.completed_at    = util::Now();
    match.matched         = matched;
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      auto&           match = *portal_status_[portal_id].match;
      match.state           = RefreshState::kError;
      match.completed_at    = util::Now();
      match.error           = e.what();
    }
    throw;
  }
}

void JobScheduler::RefreshEpg() {
  {
    std::lock_guard lock(mutex_);
    epg_status_.state      = RefreshState::kRunning;
    epg_status_.started_at = util::Now();
    epg_status_.completed_at.reset();
  }

  if (hooks_.refresh_epg) {
    hooks_.refresh_epg();
  }

  std::lock_guard lock(mutex_);
  epg_status_.state        = RefreshState::kCompleted;
  epg_status_.completed_at = util::Now();
  epg_status_.error.clear();

  MACRELAY_LOG_INFO("EPG refresh completed");
}

} // namespace macrelay::jobs
