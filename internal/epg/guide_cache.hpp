#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

#include "internal/util/time.hpp"

namespace macrelay::epg {

/*
  Validity marker for the combined programme guide. A portal refresh
  invalidates it; a completed EPG refresh stamps it valid again.
*/
class GuideCache {
 public:
  void Invalidate();
  void MarkRefreshed(util::TimePoint stamp);

  bool                           Valid() const;
  std::optional<util::TimePoint> RefreshedAt() const;
  std::uint64_t                  Generation() const;

 private:
  mutable std::mutex             mutex_;
  bool                           valid_ = false;
  std::optional<util::TimePoint> refreshed_at_;
  std::uint64_t                  generation_ = 0;
};

} // namespace macrelay::epg
