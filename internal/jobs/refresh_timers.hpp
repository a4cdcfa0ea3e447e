#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/settings.hpp"

namespace macrelay::jobs {

struct TimerHooks {
  // re-read every cycle so a reload takes effect on the next sleep
  std::function<config::JobSettings()> settings;

  std::function<void()> refresh_channels;
  std::function<void()> refresh_epg;
  std::function<void()> vacuum;
};

struct TimerOptions {
  std::chrono::milliseconds hour{std::chrono::hours(1)};
  std::chrono::milliseconds min_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds disabled_recheck{std::chrono::hours(1)};
  std::chrono::milliseconds error_backoff{std::chrono::seconds(300)};
};

/*
  Periodic triggers for channel refresh, EPG refresh and channel-table
  vacuum. Each runs on its own thread and sleeps first, so nothing fires
  at startup.

  An interval <= 0 disables that timer; it re-checks the settings every
  disabled_recheck. Other intervals are floored at min_interval.
*/
class RefreshTimers {
 public:
  RefreshTimers(TimerHooks hooks, TimerOptions options = {});
  ~RefreshTimers();

  RefreshTimers(const RefreshTimers&)            = delete;
  RefreshTimers& operator=(const RefreshTimers&) = delete;

  void Start();
  void Stop();

  // Sleep before the next firing; zero means disabled.
  static std::chrono::milliseconds Interval(double hours, const TimerOptions& options);

 private:
  void Loop(const std::string& name, std::function<double(const config::JobSettings&)> hours, const std::function<void()>& fire);

  // false when stopped during the wait
  bool SleepFor(std::chrono::milliseconds duration);

  TimerHooks   hooks_;
  TimerOptions options_;

  std::mutex               mutex_;
  std::condition_variable  cv_;
  bool                     running_ = false;
  std::vector<std::thread> threads_;
};

} // namespace macrelay::jobs
