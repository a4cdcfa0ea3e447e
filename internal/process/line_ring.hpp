#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace macrelay::process {

/*
  Bounded ring of the most recent diagnostic lines of a child process.
*/
class LineRing {
 public:
  explicit LineRing(std::size_t capacity) : capacity_(capacity) {
  }

  void Push(std::string line) {
    if (capacity_ == 0) return;
    std::lock_guard lock(mutex_);
    if (lines_.size() == capacity_) lines_.pop_front();
    lines_.push_back(std::move(line));
  }

  // Last n lines, oldest first.
  std::vector<std::string> Last(std::size_t n) const {
    std::lock_guard lock(mutex_);
    const auto      skip = lines_.size() > n ? lines_.size() - n : 0;
    return {lines_.begin() + static_cast<std::ptrdiff_t>(skip), lines_.end()};
  }

  std::vector<std::string> All() const {
    return Last(capacity_);
  }

 private:
  std::size_t             capacity_;
  mutable std::mutex      mutex_;
  std::deque<std::string> lines_;
};

} // namespace macrelay::process
