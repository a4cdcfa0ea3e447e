#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace macrelay::upstream {

struct UpstreamChannel {
  std::string id;
  std::string name;
  std::string number;
  std::string cmd;
  std::string genre_id;
};

/*
  Upstream portal protocol client.

  Every call is keyed by (url, mac, proxy). An absent result means the
  portal refused or returned nothing usable; transport errors may throw.
  Implementations must be safe to call from several threads.
*/
class PortalClient {
 public:
  virtual ~PortalClient() = default;

  virtual std::optional<std::string> GetToken(const std::string& url, const std::string& mac, const std::string& proxy) = 0;

  // keep-alive call, the caller ignores the payload
  virtual std::optional<std::map<std::string, std::string>> GetProfile(const std::string& url, const std::string& mac, const std::string& token,
                                                                       const std::string& proxy) = 0;

  virtual std::optional<std::vector<UpstreamChannel>> GetAllChannels(const std::string& url, const std::string& mac, const std::string& token,
                                                                     const std::string& proxy) = 0;

  virtual std::optional<std::string> GetLink(const std::string& url, const std::string& mac, const std::string& token, const std::string& cmd,
                                             const std::string& proxy) = 0;

  virtual std::optional<std::string> GetExpires(const std::string& url, const std::string& mac, const std::string& token, const std::string& proxy) = 0;

  // genre id -> display name
  virtual std::optional<std::map<std::string, std::string>> GetGenreNames(const std::string& url, const std::string& mac, const std::string& token,
                                                                          const std::string& proxy) = 0;
};

} // namespace macrelay::upstream
