#include "portal_locks.hpp"

namespace macrelay::portal {

std::shared_ptr<std::mutex> PortalLocks::For(const std::string& portal_id) {
  std::lock_guard lock(mutex_);

  auto& slot = locks_[portal_id];
  if (!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

} // namespace macrelay::portal
