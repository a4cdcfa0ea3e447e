#include "refresh_timers.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"

namespace macrelay::jobs {

using observability::IntField;
using observability::StringField;

RefreshTimers::RefreshTimers(TimerHooks hooks, TimerOptions options) : hooks_(std::move(hooks)), options_(options) {
}

RefreshTimers::~RefreshTimers() {
  Stop();
}

std::chrono::milliseconds RefreshTimers::Interval(double hours, const TimerOptions& options) {
  if (hours <= 0) {
    return std::chrono::milliseconds::zero();
  }
  const auto scaled = std::chrono::milliseconds(static_cast<std::int64_t>(hours * options.hour.count()));
  return std::max(options.min_interval, scaled);
}

void RefreshTimers::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
  }

  threads_.emplace_back([this] {
    Loop("channels", [](const config::JobSettings& s) { return s.channel_refresh_interval_hours; },
         hooks_.refresh_channels);
  });
  threads_.emplace_back([this] {
    Loop("epg", [](const config::JobSettings& s) { return s.epg_refresh_interval_hours; },
         hooks_.refresh_epg);
  });
  threads_.emplace_back([this] {
    Loop("vacuum", [](const config::JobSettings& s) { return s.vacuum_channels_interval_hours; },
         hooks_.vacuum);
  });
}

void RefreshTimers::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();

  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

bool RefreshTimers::SleepFor(std::chrono::milliseconds duration) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, duration, [this] { return !running_; });
  return running_;
}

void RefreshTimers::Loop(const std::string& name, std::function<double(const config::JobSettings&)> hours,
                         const std::function<void()>& fire) {
  while (true) {
    std::chrono::milliseconds wait = options_.error_backoff;
    bool                      fire_after_wait = false;

    try {
      const auto settings = hooks_.settings ? hooks_.settings() : config::JobSettings{};
      const auto interval = Interval(hours(settings), options_);

      if (interval == std::chrono::milliseconds::zero()) {
        MACRELAY_LOG_DEBUG("Refresh timer disabled", {StringField("timer", name)});
        wait = options_.disabled_recheck;
      } else {
        wait            = interval;
        fire_after_wait = true;
      }
    } catch (const std::exception& e) {
      MACRELAY_LOG_ERROR("Refresh timer failed", {StringField("timer", name), StringField("error", e.what())});
    }

    if (!SleepFor(wait)) {
      return;
    }
    if (!fire_after_wait || !fire) {
      continue;
    }

    try {
      MACRELAY_LOG_INFO("Refresh timer fired", {StringField("timer", name), IntField("interval_ms", wait.count())});
      fire();
    } catch (const std::exception& e) {
      MACRELAY_LOG_ERROR("Refresh timer failed", {StringField("timer", name), StringField("error", e.what())});
      if (!SleepFor(options_.error_backoff)) {
        return;
      }
    }
  }
}

} // namespace macrelay::jobs
