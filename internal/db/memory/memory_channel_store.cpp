#include "memory_channel_store.hpp"

#include <algorithm>
#include <set>

namespace macrelay::db::memory {

std::optional<model::CachedChannelEntry> MemoryChannelStore::Get(const std::string& portal_id, const std::string& channel_id) {
  std::lock_guard lock(mutex_);

  auto it = channels_.find({portal_id, channel_id});
  if (it == channels_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CachedChannelEntry> MemoryChannelStore::ListPortalChannels(const std::string& portal_id) {
  std::lock_guard lock(mutex_);

  std::vector<model::CachedChannelEntry> out;
  for (auto it = channels_.lower_bound({portal_id, ""}); it != channels_.end() && it->first.first == portal_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryChannelStore::ReplacePortalChannels(const std::string& portal_id, const std::vector<model::CachedChannelEntry>& channels) {
  std::lock_guard lock(mutex_);

  std::map<Key, model::CachedChannelEntry> fresh;
  for (auto entry : channels) {
    entry.portal_id = portal_id;
    Key key{portal_id, entry.channel_id};

    if (auto old = channels_.find(key); old != channels_.end()) {
      entry.alternate_channel_ids = old->second.alternate_channel_ids;
      entry.enabled               = old->second.enabled;
    }
    fresh[key] = std::move(entry);
  }

  for (auto it = channels_.lower_bound({portal_id, ""}); it != channels_.end() && it->first.first == portal_id;) {
    it = channels_.erase(it);
  }
  channels_.merge(fresh);
  return Result::Ok();
}

Result MemoryChannelStore::SetAlternateIds(const std::string& portal_id, const std::string& channel_id, const std::vector<std::string>& alternate_ids) {
  std::lock_guard lock(mutex_);

  auto it = channels_.find({portal_id, channel_id});
  if (it == channels_.end()) return Result::Fail(StoreError::kNotFound, "channel not found");
  it->second.alternate_channel_ids = alternate_ids;
  return Result::Ok();
}

Result MemoryChannelStore::SetEnabled(const std::string& portal_id, const std::string& channel_id, bool enabled) {
  std::lock_guard lock(mutex_);

  auto it = channels_.find({portal_id, channel_id});
  if (it == channels_.end()) return Result::Fail(StoreError::kNotFound, "channel not found");
  it->second.enabled = enabled;
  return Result::Ok();
}

model::PortalChannelStats MemoryChannelStore::Stats(const std::string& portal_id) {
  std::lock_guard lock(mutex_);

  model::PortalChannelStats stats;
  std::set<std::string>     groups;
  std::set<std::string>     enabled_groups;
  for (auto it = channels_.lower_bound({portal_id, ""}); it != channels_.end() && it->first.first == portal_id; ++it) {
    const auto& entry = it->second;
    ++stats.total_channels;
    groups.insert(entry.genre_id);
    if (entry.enabled) {
      ++stats.enabled_channels;
      enabled_groups.insert(entry.genre_id);
    }
  }
  stats.total_groups   = groups.size();
  stats.enabled_groups = enabled_groups.size();
  return stats;
}

Result MemoryChannelStore::Vacuum(const std::vector<std::string>& live_portal_ids) {
  std::lock_guard lock(mutex_);

  for (auto it = channels_.begin(); it != channels_.end();) {
    const bool live = std::find(live_portal_ids.begin(), live_portal_ids.end(), it->first.first) != live_portal_ids.end();
    it              = live ? std::next(it) : channels_.erase(it);
  }
  return Result::Ok();
}

} // namespace macrelay::db::memory
