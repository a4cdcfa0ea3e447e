#include "internal/jobs/channel_refresher.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_channel_store.hpp"
#include "internal/portal/portal_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/fixtures/fake_portal_client.hpp"

namespace {

using macrelay::jobs::ChannelRefresher;
using macrelay::testing::FakeMac;
using macrelay::testing::FakePortalClient;
using macrelay::upstream::UpstreamChannel;

UpstreamChannel Channel(const std::string& id, const std::string& name, const std::string& cmd, const std::string& genre_id = "1") {
  UpstreamChannel c;
  c.id       = id;
  c.name     = name;
  c.number   = id;
  c.cmd      = cmd;
  c.genre_id = genre_id;
  return c;
}

struct Harness {
  std::shared_ptr<FakePortalClient>                         client   = std::make_shared<FakePortalClient>();
  std::shared_ptr<macrelay::portal::PortalStore>            portals;
  std::shared_ptr<macrelay::db::memory::MemoryChannelStore> channels = std::make_shared<macrelay::db::memory::MemoryChannelStore>();

  explicit Harness(std::vector<std::string> macs) {
    portals = std::make_shared<macrelay::portal::PortalStore>(std::make_shared<macrelay::portal::PortalLocks>());
    macrelay::model::Portal p;
    p.id  = "p1";
    p.url = "http://portal/c/";
    for (auto& m : macs) p.macs.push_back({m, "", 0, 0});
    portals->Upsert(p);
  }

  ChannelRefresher Refresher() {
    return ChannelRefresher(client, portals, channels);
  }
};

void TestMergesListsAcrossMacs() {
  Harness h({"A", "B", "C"});

  FakeMac a;
  a.channels = std::vector<UpstreamChannel>{Channel("1", "News", ""), Channel("2", "Sport", "ffmpeg http://up/2")};
  a.genres   = std::map<std::string, std::string>{{"1", "General"}};
  h.client->Set("A", a);

  FakeMac b;
  b.channels = std::vector<UpstreamChannel>{Channel("1", "News", "ffmpeg http://up/1"), Channel("3", "Movies", "", "9")};
  b.genres   = std::map<std::string, std::string>{{"9", "Film"}};
  h.client->Set("B", b);

  // C has no token and is skipped
  assert(h.Refresher().Refresh("p1") == 3);

  auto stored = h.channels->ListPortalChannels("p1");
  assert(stored.size() == 3);

  auto news = h.channels->Get("p1", "1");
  assert(news);
  assert((news->available_macs == std::vector<std::string>{"A", "B"}));
  assert(news->cached_cmd && *news->cached_cmd == "ffmpeg http://up/1");
  assert(news->genre == "General");

  auto sport = h.channels->Get("p1", "2");
  assert((sport->available_macs == std::vector<std::string>{"A"}));
  assert(sport->cached_cmd && *sport->cached_cmd == "ffmpeg http://up/2");

  auto movies = h.channels->Get("p1", "3");
  assert(!movies->cached_cmd);
  assert(movies->genre == "Film");

  assert(h.client->ChannelListCalls() == 2);
}

void TestRefreshReplacesPreviousList() {
  Harness h({"A"});

  FakeMac a;
  a.channels = std::vector<UpstreamChannel>{Channel("1", "News", ""), Channel("2", "Sport", "")};
  h.client->Set("A", a);
  assert(h.Refresher().Refresh("p1") == 2);

  a.channels = std::vector<UpstreamChannel>{Channel("2", "Sport HD", "")};
  h.client->Set("A", a);
  assert(h.Refresher().Refresh("p1") == 1);

  assert(!h.channels->Get("p1", "1"));
  assert(h.channels->Get("p1", "2")->name == "Sport HD");
}

void TestNoListIsAnError() {
  Harness h({"A", "B"});

  FakeMac tokenless;
  tokenless.token.reset();
  h.client->Set("A", tokenless);
  h.client->Set("B", FakeMac{});

  bool threw = false;
  try {
    h.Refresher().Refresh("p1");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(h.channels->ListPortalChannels("p1").empty());
}

void TestUnknownPortal() {
  Harness h({"A"});

  bool threw = false;
  try {
    h.Refresher().Refresh("nope");
  } catch (const macrelay::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMergesListsAcrossMacs();
  TestRefreshReplacesPreviousList();
  TestNoListIsAnError();
  TestUnknownPortal();

  std::cout << "macrelay_unit_channel_refresher: pass\n";
  return 0;
}
