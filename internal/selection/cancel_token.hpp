#pragma once

#include <atomic>

namespace macrelay::selection {

// Cooperative cancellation flag shared by sibling probes.
class CancelToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool Cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace macrelay::selection
