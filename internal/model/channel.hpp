#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace macrelay::model {

struct CachedChannelEntry {
  std::string portal_id;
  std::string channel_id;
  std::string name;
  std::string number;
  std::string genre_id;
  std::string genre;

  // fast path: skip the upstream channel list fetch when present
  std::optional<std::string> cached_cmd;

  // MACs known to serve this channel, preferred during probing
  std::vector<std::string> available_macs;

  // tried in order after the primary id
  std::vector<std::string> alternate_channel_ids;

  bool enabled = true;
};

struct PortalChannelStats {
  std::uint64_t total_channels = 0;
  std::uint64_t enabled_channels = 0;
  std::uint64_t total_groups = 0;
  std::uint64_t enabled_groups = 0;
};

} // namespace macrelay::model
