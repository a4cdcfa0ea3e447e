#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace macrelay::upstream {
class PortalClient;
}
namespace macrelay::portal {
class PortalStore;
}
namespace macrelay::db {
class ChannelStore;
}

namespace macrelay::jobs {

/*
  Pulls a portal's channel list through every one of its MACs and writes
  the merged result to the channel store.

  A channel seen through several MACs is stored once, with every serving
  MAC in available_macs and the cmd of the first MAC that listed it.
*/
class ChannelRefresher {
 public:
  ChannelRefresher(std::shared_ptr<upstream::PortalClient> client, std::shared_ptr<portal::PortalStore> portals,
                   std::shared_ptr<db::ChannelStore> channels);

  // Returns the number of channels stored. Throws NotFound for an unknown
  // portal and std::runtime_error when no MAC returned a channel list.
  std::int64_t Refresh(const std::string& portal_id);

 private:
  std::shared_ptr<upstream::PortalClient> client_;
  std::shared_ptr<portal::PortalStore>    portals_;
  std::shared_ptr<db::ChannelStore>       channels_;
};

} // namespace macrelay::jobs
