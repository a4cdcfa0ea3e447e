#include "internal/portal/portal_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using macrelay::model::MacRecord;
using macrelay::model::Portal;
using macrelay::portal::PortalLocks;
using macrelay::portal::PortalStore;

Portal MakePortal(const std::string& id, std::vector<std::string> macs, bool enabled = true) {
  Portal p;
  p.id      = id;
  p.enabled = enabled;
  for (auto& m : macs) {
    MacRecord r;
    r.mac = m;
    p.macs.push_back(r);
  }
  return p;
}

std::vector<std::string> MacOrder(const PortalStore& store, const std::string& id) {
  std::vector<std::string> out;
  const auto portal = store.Get(id);
  for (const auto& r : portal->macs) out.push_back(r.mac);
  return out;
}

void TestMoveMacRotatesToEnd() {
  PortalStore store(std::make_shared<PortalLocks>());
  store.Upsert(MakePortal("p1", {"A", "B", "C"}));

  store.MoveMac("p1", "A");
  assert((MacOrder(store, "p1") == std::vector<std::string>{"B", "C", "A"}));

  store.MoveMac("p1", "unknown");
  assert((MacOrder(store, "p1") == std::vector<std::string>{"B", "C", "A"}));
}

void TestMoveMacsKeepsFailureOrder() {
  PortalStore store(std::make_shared<PortalLocks>());
  store.Upsert(MakePortal("p1", {"A", "B", "C", "D"}));

  store.MoveMacs("p1", {"B", "A"});
  assert((MacOrder(store, "p1") == std::vector<std::string>{"C", "D", "B", "A"}));
}

void TestMoveMacUnknownPortalThrows() {
  PortalStore store(std::make_shared<PortalLocks>());

  bool threw = false;
  try {
    store.MoveMac("missing", "A");
  } catch (const macrelay::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestEnabledPortalIdsKeepInsertionOrder() {
  PortalStore store(std::make_shared<PortalLocks>());
  store.Upsert(MakePortal("b", {"A"}));
  store.Upsert(MakePortal("a", {"A"}, false));
  store.Upsert(MakePortal("c", {"A"}));

  assert((store.EnabledPortalIds() == std::vector<std::string>{"b", "c"}));
  assert(store.List().size() == 3);
  assert(!store.Get("zzz"));
}

void TestRotationWaitsForPortalLock() {
  auto        locks = std::make_shared<PortalLocks>();
  PortalStore store(locks);
  store.Upsert(MakePortal("p1", {"A", "B"}));

  auto portal_mutex = locks->For("p1");
  std::unique_lock held(*portal_mutex);

  std::thread rotate([&] { store.MoveMac("p1", "A"); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert((MacOrder(store, "p1") == std::vector<std::string>{"A", "B"}));

  held.unlock();
  rotate.join();
  assert((MacOrder(store, "p1") == std::vector<std::string>{"B", "A"}));
}

void TestFromConfigDefaults() {
  macrelay::runtime::config::RuntimeConfig config;
  auto* pc = config.add_portals();
  pc->set_id("7");
  pc->set_url("http://portal/c/");
  auto* mc = pc->add_macs();
  mc->set_mac("00:1A:79:00:00:01");
  mc->set_watchdog_timeout_seconds(600);

  auto store  = PortalStore::FromConfig(config, std::make_shared<PortalLocks>());
  auto portal = store->Get("7");
  assert(portal);
  assert(portal->name == "7");
  assert(portal->enabled);
  assert(portal->streams_per_mac == 1);
  assert(portal->macs.size() == 1);
  assert(portal->macs[0].watchdog_timeout_seconds == 600);
}

} // namespace

int main() {
  TestMoveMacRotatesToEnd();
  TestMoveMacsKeepsFailureOrder();
  TestMoveMacUnknownPortalThrows();
  TestEnabledPortalIdsKeepInsertionOrder();
  TestRotationWaitsForPortalLock();
  TestFromConfigDefaults();

  std::cout << "macrelay_unit_portal_store: pass\n";
  return 0;
}
