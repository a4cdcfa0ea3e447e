#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/channel_store.hpp"

namespace macrelay::db::memory {

class MemoryChannelStore final : public db::ChannelStore {
 public:
  std::optional<model::CachedChannelEntry> Get(const std::string& portal_id, const std::string& channel_id) override;
  std::vector<model::CachedChannelEntry>   ListPortalChannels(const std::string& portal_id) override;
  Result ReplacePortalChannels(const std::string& portal_id, const std::vector<model::CachedChannelEntry>& channels) override;
  Result SetAlternateIds(const std::string& portal_id, const std::string& channel_id, const std::vector<std::string>& alternate_ids) override;
  Result SetEnabled(const std::string& portal_id, const std::string& channel_id, bool enabled) override;
  model::PortalChannelStats Stats(const std::string& portal_id) override;
  Result                    Vacuum(const std::vector<std::string>& live_portal_ids) override;

 private:
  using Key = std::pair<std::string, std::string>;

  std::mutex                               mutex_;
  std::map<Key, model::CachedChannelEntry> channels_;
};

} // namespace macrelay::db::memory
