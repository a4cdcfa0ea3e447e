#pragma once

#include "portal_client.hpp"

namespace macrelay::upstream {

/*
  PortalClient that answers every call with "absent". Wired by default
  until a protocol client is linked in; every stream request then ends
  as "no stream available".
*/
class OfflinePortalClient final : public PortalClient {
 public:
  std::optional<std::string> GetToken(const std::string& url, const std::string& mac, const std::string& proxy) override;
  std::optional<std::map<std::string, std::string>> GetProfile(const std::string& url, const std::string& mac, const std::string& token,
                                                               const std::string& proxy) override;
  std::optional<std::vector<UpstreamChannel>> GetAllChannels(const std::string& url, const std::string& mac, const std::string& token,
                                                             const std::string& proxy) override;
  std::optional<std::string> GetLink(const std::string& url, const std::string& mac, const std::string& token, const std::string& cmd,
                                     const std::string& proxy) override;
  std::optional<std::string> GetExpires(const std::string& url, const std::string& mac, const std::string& token, const std::string& proxy) override;
  std::optional<std::map<std::string, std::string>> GetGenreNames(const std::string& url, const std::string& mac, const std::string& token,
                                                                  const std::string& proxy) override;
};

} // namespace macrelay::upstream
