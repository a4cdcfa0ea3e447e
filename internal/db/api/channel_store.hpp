#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/channel.hpp"

namespace macrelay::db {

/*
  Cached channel data per portal.

  The engine reads point lookups on the request path; the refresh job
  replaces a portal's channel set in bulk. Operator-owned columns
  (alternate ids, enabled flag) survive a replace.
*/
class ChannelStore {
 public:
  virtual ~ChannelStore() = default;

  virtual std::optional<model::CachedChannelEntry> Get(const std::string& portal_id, const std::string& channel_id) = 0;

  virtual std::vector<model::CachedChannelEntry> ListPortalChannels(const std::string& portal_id) = 0;

  // Rows of portal_id missing from channels are dropped.
  virtual Result ReplacePortalChannels(const std::string& portal_id, const std::vector<model::CachedChannelEntry>& channels) = 0;

  virtual Result SetAlternateIds(const std::string& portal_id, const std::string& channel_id, const std::vector<std::string>& alternate_ids) = 0;

  virtual Result SetEnabled(const std::string& portal_id, const std::string& channel_id, bool enabled) = 0;

  virtual model::PortalChannelStats Stats(const std::string& portal_id) = 0;

  // Drops channels of portals that are no longer configured and compacts storage.
  virtual Result Vacuum(const std::vector<std::string>& live_portal_ids) = 0;
};

} // namespace macrelay::db
