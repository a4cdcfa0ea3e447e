#include "channel_refresher.hpp"

#include <map>
#include <stdexcept>
#include <vector>

#include "internal/db/api/channel_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/portal/portal_store.hpp"
#include "internal/upstream/portal_client.hpp"
#include "internal/util/errors.hpp"

namespace macrelay::jobs {

using observability::IntField;
using observability::StringField;

ChannelRefresher::ChannelRefresher(std::shared_ptr<upstream::PortalClient> client,
                                   std::shared_ptr<portal::PortalStore>    portals,
                                   std::shared_ptr<db::ChannelStore>       channels)
    : client_(std::move(client)), portals_(std::move(portals)), channels_(std::move(channels)) {
  if (!client_ || !portals_ || !channels_) {
    throw std::invalid_argument("ChannelRefresher: dependencies required");
  }
}

std::int64_t ChannelRefresher::Refresh(const std::string& portal_id) {
  const auto portal = portals_->Get(portal_id);
  if (!portal) {
    throw util::NotFound("portal not found: " + portal_id);
  }

  std::map<std::string, model::CachedChannelEntry> by_id;
  std::vector<std::string>                         order;
  std::map<std::string, std::string>               genres;
  bool                                             any_list = false;

  for (const auto& record : portal->macs) {
    const auto token = client_->GetToken(portal->url, record.mac, portal->proxy);
    if (!token) {
      MACRELAY_LOG_WARN("Channel refresh: no token",
                        {StringField("portal_id", portal_id), StringField("mac", record.mac)});
      continue;
    }

    client_->GetProfile(portal->url, record.mac, *token, portal->proxy);

    const auto listed = client_->GetAllChannels(portal->url, record.mac, *token, portal->proxy);
    if (!listed) {
      MACRELAY_LOG_WARN("Channel refresh: no channel list",
                        {StringField("portal_id", portal_id), StringField("mac", record.mac)});
      continue;
    }
    any_list = true;

    if (auto names = client_->GetGenreNames(portal->url, record.mac, *token, portal->proxy)) {
      for (auto& [id, name] : *names) {
        genres.emplace(id, name);
      }
    }

    for (const auto& ch : *listed) {
      auto it = by_id.find(ch.id);
      if (it == by_id.end()) {
        model::CachedChannelEntry entry;
        entry.portal_id  = portal_id;
        entry.channel_id = ch.id;
        entry.name       = ch.name;
        entry.number     = ch.number;
        entry.genre_id   = ch.genre_id;
        if (!ch.cmd.empty()) {
          entry.cached_cmd = ch.cmd;
        }
        entry.available_macs.push_back(record.mac);
        order.push_back(ch.id);
        by_id.emplace(ch.id, std::move(entry));
        continue;
      }

      auto& macs = it->second.available_macs;
      if (macs.empty() || macs.back() != record.mac) {
        macs.push_back(record.mac);
      }
      if (!it->second.cached_cmd && !ch.cmd.empty()) {
        it->second.cached_cmd = ch.cmd;
      }
    }
  }

  if (!any_list) {
    throw std::runtime_error("no channel list from any MAC of portal " + portal_id);
  }

  std::vector<model::CachedChannelEntry> entries;
  entries.reserve(order.size());
  for (const auto& id : order) {
    auto& entry = by_id.at(id);
    if (auto g = genres.find(entry.genre_id); g != genres.end()) {
      entry.genre = g->second;
    }
    entries.push_back(std::move(entry));
  }

  if (auto r = channels_->ReplacePortalChannels(portal_id, entries); !r) {
    throw std::runtime_error("channel store write failed: " + r.Describe());
  }

  MACRELAY_LOG_INFO("Channel refresh stored",
                    {StringField("portal_id", portal_id),
                     IntField("channels", static_cast<std::int64_t>(entries.size())),
                     IntField("macs", static_cast<std::int64_t>(portal->macs.size()))});

  return static_cast<std::int64_t>(entries.size());
}

} // namespace macrelay::jobs
