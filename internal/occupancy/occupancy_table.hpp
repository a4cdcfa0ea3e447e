#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/occupied_session.hpp"

namespace macrelay::occupancy {

/*
  Live direct-delivery sessions per portal.

  Capacity check and insert happen under one lock acquisition, so the
  number of sessions on a MAC never exceeds streams_per_mac (0 = unlimited)
  regardless of how many requests race for it.
*/
class OccupancyTable {
 public:
  // Returns the session id, or nullopt when the MAC is at capacity.
  std::optional<std::string> TryOccupy(model::OccupiedSession session, std::uint32_t streams_per_mac);

  void Release(const std::string& session_id);

  std::size_t CountFor(const std::string& portal_id, const std::string& mac) const;
  bool        HasFreeSlot(const std::string& portal_id, const std::string& mac, std::uint32_t streams_per_mac) const;

  std::vector<model::OccupiedSession> Snapshot(const std::string& portal_id) const;
  std::vector<model::OccupiedSession> SnapshotAll() const;
  std::size_t                         Size() const;

 private:
  static std::string Key(const std::string& portal_id, const std::string& mac);

  mutable std::mutex mutex_;

  std::unordered_map<std::string, model::OccupiedSession> sessions_;
  std::unordered_map<std::string, std::size_t>            per_mac_;
  std::uint64_t                                           next_id_ = 1;
};

/*
  Releases an occupied slot on scope exit.
*/
class OccupancyGuard {
 public:
  OccupancyGuard() = default;
  OccupancyGuard(OccupancyTable& table, std::string session_id) : table_(&table), session_id_(std::move(session_id)) {
  }
  ~OccupancyGuard() {
    Release();
  }

  OccupancyGuard(const OccupancyGuard&)            = delete;
  OccupancyGuard& operator=(const OccupancyGuard&) = delete;

  OccupancyGuard(OccupancyGuard&& other) noexcept : table_(other.table_), session_id_(std::move(other.session_id_)) {
    other.table_ = nullptr;
  }

  OccupancyGuard& operator=(OccupancyGuard&& other) noexcept {
    if (this != &other) {
      Release();
      table_       = other.table_;
      session_id_  = std::move(other.session_id_);
      other.table_ = nullptr;
    }
    return *this;
  }

  void Release() {
    if (table_) {
      table_->Release(session_id_);
      table_ = nullptr;
    }
  }

  bool Held() const {
    return table_ != nullptr;
  }

 private:
  OccupancyTable* table_ = nullptr;
  std::string     session_id_;
};

} // namespace macrelay::occupancy
