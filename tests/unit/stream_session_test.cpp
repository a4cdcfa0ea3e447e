#include "internal/streaming/stream_session.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_channel_store.hpp"
#include "internal/portal/portal_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/fixtures/fake_portal_client.hpp"

namespace {

using namespace std::chrono_literals;
using macrelay::config::StreamingSettings;
using macrelay::model::SessionState;
using macrelay::process::Process;
using macrelay::process::ProcessOptions;
using macrelay::streaming::StreamDeps;
using macrelay::streaming::StreamOutcome;
using macrelay::streaming::StreamRequest;
using macrelay::streaming::StreamSession;
using macrelay::testing::EmbeddedChannel;
using macrelay::testing::FakeMac;
using macrelay::testing::FakePortalClient;
using macrelay::util::StreamUnavailable;
using macrelay::util::UnavailableReason;

// Stands in for ffmpeg: the link's path picks the behaviour.
std::unique_ptr<Process> FakeFfmpeg(const std::vector<std::string>& argv, ProcessOptions options) {
  std::string link;
  for (const auto& a : argv) {
    if (a.rfind("http://", 0) == 0) link = a;
  }

  std::string script = "printf 'abcdef'";
  if (link.find("/crash") != std::string::npos) script = "printf 'xy'; echo 'Connection refused' >&2; exit 1";
  if (link.find("/endless") != std::string::npos) script = "while :; do printf 'zzzzzzzz'; done";
  return Process::Spawn({"/bin/sh", "-c", script}, std::move(options));
}

struct Harness {
  std::shared_ptr<FakePortalClient>                       client    = std::make_shared<FakePortalClient>();
  std::shared_ptr<macrelay::occupancy::OccupancyTable>    occupancy = std::make_shared<macrelay::occupancy::OccupancyTable>();
  std::shared_ptr<macrelay::portal::PortalStore>          portals;
  std::shared_ptr<macrelay::db::memory::MemoryChannelStore> channels = std::make_shared<macrelay::db::memory::MemoryChannelStore>();
  StreamingSettings                                       settings;

  explicit Harness(std::vector<std::string> macs, std::uint32_t streams_per_mac = 1) {
    portals = std::make_shared<macrelay::portal::PortalStore>(std::make_shared<macrelay::portal::PortalLocks>());
    macrelay::model::Portal p;
    p.id              = "p1";
    p.url             = "http://portal/c/";
    p.streams_per_mac = streams_per_mac;
    for (auto& m : macs) p.macs.push_back({m, "", 0, 0});
    portals->Upsert(p);

    settings.test_streams     = false;
    settings.chunk_size_bytes = 4;
  }

  void Serve(const std::string& mac, const std::string& link) {
    FakeMac m;
    m.channels = std::vector<macrelay::upstream::UpstreamChannel>{EmbeddedChannel("100", "News", link)};
    client->Set(mac, m);
  }

  std::unique_ptr<StreamSession> Session(const std::string& portal_id = "p1") {
    StreamDeps deps;
    deps.portals    = portals;
    deps.channels   = channels;
    deps.occupancy  = occupancy;
    deps.executor   = std::make_shared<macrelay::selection::ProbeExecutor>(client, occupancy, portals, FakeFfmpeg);
    deps.spawn      = FakeFfmpeg;
    deps.exit_grace = 1000ms;

    StreamRequest req;
    req.portal_id   = portal_id;
    req.channel_id  = "100";
    req.client_addr = "10.0.0.5";
    return std::make_unique<StreamSession>(std::move(deps), std::move(req), settings);
  }

  std::vector<std::string> Order() const {
    std::vector<std::string> out;
    const auto portal = portals->Get("p1");
    for (const auto& r : portal->macs) out.push_back(r.mac);
    return out;
  }
};

void TestRelayDeliversChunksAndReleasesSlot() {
  Harness h({"A"});
  h.Serve("A", "http://up/ok");

  auto session = h.Session();
  session->Acquire();
  assert(session->Mac() == "A");
  assert(session->State() == SessionState::kOccupied);
  assert(h.occupancy->CountFor("p1", "A") == 1);

  std::vector<std::string> chunks;
  auto outcome = session->Relay([&](std::string_view data) {
    // the slot is held for the whole relay
    assert(h.occupancy->CountFor("p1", "A") == 1);
    chunks.emplace_back(data);
    return true;
  });

  assert(outcome == StreamOutcome::kCompleted);
  std::string joined;
  for (const auto& c : chunks) {
    assert(c.size() <= 4);
    joined += c;
  }
  assert(joined == "abcdef");
  assert(h.occupancy->Size() == 0);
  assert(session->State() == SessionState::kClosed);
  assert((h.Order() == std::vector<std::string>{"A"}));
}

void TestCrashDeprioritizesMac() {
  Harness h({"A", "B"});
  h.Serve("A", "http://up/crash");
  h.Serve("B", "http://up/ok");

  auto session = h.Session();
  session->Acquire();
  assert(session->Mac() == "A");

  std::string received;
  auto        outcome = session->Relay([&](std::string_view data) {
    received.append(data);
    return true;
  });

  assert(outcome == StreamOutcome::kProcessCrashed);
  assert(received == "xy");
  assert(h.occupancy->Size() == 0);
  assert((h.Order() == std::vector<std::string>{"B", "A"}));
}

void TestClientDisconnectKillsProcess() {
  Harness h({"A"});
  h.Serve("A", "http://up/endless");

  auto session = h.Session();
  session->Acquire();

  int  writes  = 0;
  auto outcome = session->Relay([&](std::string_view) { return ++writes < 3; });

  assert(outcome == StreamOutcome::kClientDisconnected);
  assert(writes == 3);
  assert(h.occupancy->Size() == 0);

  // a disconnect is not the credential's fault
  assert((h.Order() == std::vector<std::string>{"A"}));
}

void TestFullPortalIsNoFreeCredential() {
  Harness h({"A"});
  h.Serve("A", "http://up/ok");

  auto first = h.Session();
  first->Acquire();

  auto second = h.Session();
  bool threw  = false;
  try {
    second->Acquire();
  } catch (const StreamUnavailable& e) {
    threw = true;
    assert(e.Reason() == UnavailableReason::kNoFreeCredential);
    assert(std::string(e.what()) == "No streams available");
  }
  assert(threw);
  assert(second->State() == SessionState::kExhausted);
  assert(h.occupancy->CountFor("p1", "A") == 1);
}

void TestBrokenMacsAreNoWorkingStream() {
  Harness h({"A", "B"});

  auto session = h.Session();
  bool threw   = false;
  try {
    session->Acquire();
  } catch (const StreamUnavailable& e) {
    threw = true;
    assert(e.Reason() == UnavailableReason::kNoWorkingStream);
  }
  assert(threw);
  assert(h.occupancy->Size() == 0);
}

void TestUnknownPortalIsNotFound() {
  Harness h({"A"});
  auto    session = h.Session("missing");

  bool threw = false;
  try {
    session->Acquire();
  } catch (const macrelay::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRedirectModeSkipsOccupancy() {
  Harness h({"A"});
  h.Serve("A", "http://up/ok");
  h.settings.stream_method = "redirect";

  auto session = h.Session();
  session->Acquire();
  assert(session->IsRedirect());
  assert(session->Link() == "http://up/ok");
  assert(h.occupancy->Size() == 0);
}

void TestDestructorReleasesUnusedSlot() {
  Harness h({"A"});
  h.Serve("A", "http://up/ok");
  {
    auto session = h.Session();
    session->Acquire();
    assert(h.occupancy->Size() == 1);
  }
  assert(h.occupancy->Size() == 0);
}

} // namespace

int main() {
  TestRelayDeliversChunksAndReleasesSlot();
  TestCrashDeprioritizesMac();
  TestClientDisconnectKillsProcess();
  TestFullPortalIsNoFreeCredential();
  TestBrokenMacsAreNoWorkingStream();
  TestUnknownPortalIsNotFound();
  TestRedirectModeSkipsOccupancy();
  TestDestructorReleasesUnusedSlot();

  std::cout << "macrelay_unit_stream_session: pass\n";
  return 0;
}
