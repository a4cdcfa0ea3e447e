#include "guide_cache.hpp"

#include "internal/observability/logging.hpp"

namespace macrelay::epg {

void GuideCache::Invalidate() {
  std::lock_guard lock(mutex_);
  if (valid_) {
    MACRELAY_LOG_DEBUG("Guide cache invalidated");
  }
  valid_ = false;
}

void GuideCache::MarkRefreshed(util::TimePoint stamp) {
  std::lock_guard lock(mutex_);
  valid_        = true;
  refreshed_at_ = stamp;
  ++generation_;
}

bool GuideCache::Valid() const {
  std::lock_guard lock(mutex_);
  return valid_;
}

std::optional<util::TimePoint> GuideCache::RefreshedAt() const {
  std::lock_guard lock(mutex_);
  return refreshed_at_;
}

std::uint64_t GuideCache::Generation() const {
  std::lock_guard lock(mutex_);
  return generation_;
}

} // namespace macrelay::epg
