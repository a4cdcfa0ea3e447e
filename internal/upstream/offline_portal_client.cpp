#include "offline_portal_client.hpp"

#include "internal/observability/logging.hpp"

namespace macrelay::upstream {

std::optional<std::string> OfflinePortalClient::GetToken(const std::string& url, const std::string& mac, const std::string&) {
  MACRELAY_LOG_DEBUG("Offline portal client: no token", {observability::StringField("url", url), observability::StringField("mac", mac)});
  return std::nullopt;
}

std::optional<std::map<std::string, std::string>> OfflinePortalClient::GetProfile(const std::string&, const std::string&, const std::string&,
                                                                                  const std::string&) {
  return std::nullopt;
}

std::optional<std::vector<UpstreamChannel>> OfflinePortalClient::GetAllChannels(const std::string&, const std::string&, const std::string&,
                                                                                const std::string&) {
  return std::nullopt;
}

std::optional<std::string> OfflinePortalClient::GetLink(const std::string&, const std::string&, const std::string&, const std::string&,
                                                        const std::string&) {
  return std::nullopt;
}

std::optional<std::string> OfflinePortalClient::GetExpires(const std::string&, const std::string&, const std::string&, const std::string&) {
  return std::nullopt;
}

std::optional<std::map<std::string, std::string>> OfflinePortalClient::GetGenreNames(const std::string&, const std::string&, const std::string&,
                                                                                     const std::string&) {
  return std::nullopt;
}

} // namespace macrelay::upstream
