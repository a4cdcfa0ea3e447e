#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/upstream/portal_client.hpp"

namespace macrelay::testing {

// Scripted upstream behaviour for one MAC.
struct FakeMac {
  std::optional<std::string>                          token{"token"};
  std::optional<std::vector<upstream::UpstreamChannel>> channels;
  std::optional<std::string>                          link;
  std::optional<std::map<std::string, std::string>>   genres;

  // delay before GetToken answers
  std::chrono::milliseconds token_delay{0};
};

class FakePortalClient final : public upstream::PortalClient {
 public:
  void Set(const std::string& mac, FakeMac behaviour) {
    std::lock_guard lock(mutex_);
    macs_[mac] = std::move(behaviour);
  }

  std::vector<std::string> TokenCalls() const {
    std::lock_guard lock(mutex_);
    return token_calls_;
  }

  int ChannelListCalls() const {
    std::lock_guard lock(mutex_);
    return channel_list_calls_;
  }

  int LinkCalls() const {
    std::lock_guard lock(mutex_);
    return link_calls_;
  }

  std::optional<std::string> GetToken(const std::string&, const std::string& mac, const std::string&) override {
    FakeMac behaviour;
    {
      std::lock_guard lock(mutex_);
      token_calls_.push_back(mac);
      behaviour = Find(mac);
    }
    if (behaviour.token_delay.count() > 0) std::this_thread::sleep_for(behaviour.token_delay);
    return behaviour.token;
  }

  std::optional<std::map<std::string, std::string>> GetProfile(const std::string&, const std::string&, const std::string&,
                                                               const std::string&) override {
    return std::map<std::string, std::string>{};
  }

  std::optional<std::vector<upstream::UpstreamChannel>> GetAllChannels(const std::string&, const std::string& mac, const std::string&,
                                                                       const std::string&) override {
    std::lock_guard lock(mutex_);
    ++channel_list_calls_;
    return Find(mac).channels;
  }

  std::optional<std::string> GetLink(const std::string&, const std::string& mac, const std::string&, const std::string&,
                                     const std::string&) override {
    std::lock_guard lock(mutex_);
    ++link_calls_;
    return Find(mac).link;
  }

  std::optional<std::string> GetExpires(const std::string&, const std::string&, const std::string&, const std::string&) override {
    return std::nullopt;
  }

  std::optional<std::map<std::string, std::string>> GetGenreNames(const std::string&, const std::string& mac, const std::string&,
                                                                  const std::string&) override {
    std::lock_guard lock(mutex_);
    return Find(mac).genres;
  }

 private:
  FakeMac Find(const std::string& mac) const {
    auto it = macs_.find(mac);
    if (it == macs_.end()) {
      FakeMac none;
      none.token.reset();
      return none;
    }
    return it->second;
  }

  mutable std::mutex             mutex_;
  std::map<std::string, FakeMac> macs_;
  std::vector<std::string>       token_calls_;
  int                            channel_list_calls_ = 0;
  int                            link_calls_         = 0;
};

// Channel whose cmd embeds the link directly.
inline upstream::UpstreamChannel EmbeddedChannel(const std::string& id, const std::string& name, const std::string& link) {
  upstream::UpstreamChannel c;
  c.id   = id;
  c.name = name;
  c.cmd  = "ffmpeg " + link;
  return c;
}

} // namespace macrelay::testing
