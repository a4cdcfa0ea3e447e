#include "occupancy_table.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace macrelay::occupancy {

std::string OccupancyTable::Key(const std::string& portal_id, const std::string& mac) {
  return portal_id + "|" + mac;
}

std::optional<std::string> OccupancyTable::TryOccupy(model::OccupiedSession session, std::uint32_t streams_per_mac) {
  std::size_t total = 0;
  {
    std::lock_guard lock(mutex_);

    const auto key   = Key(session.portal_id, session.mac);
    auto&      count = per_mac_[key];
    if (streams_per_mac != 0 && count >= streams_per_mac) {
      if (count == 0) per_mac_.erase(key);
      return std::nullopt;
    }

    session.id = std::to_string(next_id_++);
    ++count;
    sessions_.emplace(session.id, session);
    total = sessions_.size();
  }

  MACRELAY_LOG_INFO("Occupied",
                    {observability::StringField("portal_id", session.portal_id), observability::StringField("mac", session.mac),
                     observability::StringField("channel_id", session.channel_id), observability::StringField("client", session.client_addr)});
  observability::Metrics::Instance().SetActiveSessions("occupied", static_cast<std::int64_t>(total));
  return session.id;
}

void OccupancyTable::Release(const std::string& session_id) {
  model::OccupiedSession removed;
  std::size_t            total = 0;
  {
    std::lock_guard lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return;

    const auto key = Key(it->second.portal_id, it->second.mac);
    if (auto c = per_mac_.find(key); c != per_mac_.end() && --c->second == 0) per_mac_.erase(c);

    removed = std::move(it->second);
    sessions_.erase(it);
    total = sessions_.size();
  }

  MACRELAY_LOG_INFO("Unoccupied",
                    {observability::StringField("portal_id", removed.portal_id), observability::StringField("mac", removed.mac),
                     observability::StringField("channel_id", removed.channel_id)});
  observability::Metrics::Instance().SetActiveSessions("occupied", static_cast<std::int64_t>(total));
}

std::size_t OccupancyTable::CountFor(const std::string& portal_id, const std::string& mac) const {
  std::lock_guard lock(mutex_);

  auto it = per_mac_.find(Key(portal_id, mac));
  return it == per_mac_.end() ? 0 : it->second;
}

bool OccupancyTable::HasFreeSlot(const std::string& portal_id, const std::string& mac, std::uint32_t streams_per_mac) const {
  if (streams_per_mac == 0) return true;
  return CountFor(portal_id, mac) < streams_per_mac;
}

std::vector<model::OccupiedSession> OccupancyTable::Snapshot(const std::string& portal_id) const {
  std::lock_guard lock(mutex_);

  std::vector<model::OccupiedSession> out;
  for (const auto& [id, session] : sessions_) {
    if (session.portal_id == portal_id) out.push_back(session);
  }
  return out;
}

std::vector<model::OccupiedSession> OccupancyTable::SnapshotAll() const {
  std::lock_guard lock(mutex_);

  std::vector<model::OccupiedSession> out;
  out.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_) out.push_back(session);
  return out;
}

std::size_t OccupancyTable::Size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

} // namespace macrelay::occupancy
