#include "internal/occupancy/occupancy_table.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using macrelay::model::OccupiedSession;
using macrelay::occupancy::OccupancyGuard;
using macrelay::occupancy::OccupancyTable;

OccupiedSession Session(const std::string& portal_id, const std::string& mac, const std::string& channel = "c1") {
  OccupiedSession s;
  s.portal_id   = portal_id;
  s.mac         = mac;
  s.channel_id  = channel;
  s.client_addr = "127.0.0.1";
  return s;
}

void TestCapacityIsEnforced() {
  OccupancyTable table;

  auto first  = table.TryOccupy(Session("p1", "A"), 2);
  auto second = table.TryOccupy(Session("p1", "A"), 2);
  auto third  = table.TryOccupy(Session("p1", "A"), 2);

  assert(first && second);
  assert(*first != *second);
  assert(!third);
  assert(table.CountFor("p1", "A") == 2);
  assert(!table.HasFreeSlot("p1", "A", 2));

  // capacity is per portal
  assert(table.HasFreeSlot("p2", "A", 2));

  table.Release(*first);
  assert(table.CountFor("p1", "A") == 1);
  assert(table.HasFreeSlot("p1", "A", 2));
}

void TestUnlimitedCapacity() {
  OccupancyTable table;
  for (int i = 0; i < 10; ++i) {
    assert(table.TryOccupy(Session("p1", "A"), 0));
  }
  assert(table.CountFor("p1", "A") == 10);
}

void TestReleaseIsIdempotent() {
  OccupancyTable table;
  auto           id = table.TryOccupy(Session("p1", "A"), 1);
  assert(id);

  table.Release(*id);
  table.Release(*id);
  table.Release("unknown");
  assert(table.Size() == 0);
  assert(table.CountFor("p1", "A") == 0);
}

void TestSnapshots() {
  OccupancyTable table;
  assert(table.TryOccupy(Session("p1", "A", "c1"), 1));
  assert(table.TryOccupy(Session("p1", "B", "c2"), 1));
  assert(table.TryOccupy(Session("p2", "A", "c3"), 1));

  assert(table.Snapshot("p1").size() == 2);
  assert(table.Snapshot("p2").size() == 1);
  assert(table.Snapshot("p3").empty());
  assert(table.SnapshotAll().size() == 3);
}

void TestConcurrentOccupyNeverExceedsCapacity() {
  OccupancyTable table;

  constexpr int          kThreads = 16;
  std::atomic<int>       granted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      if (table.TryOccupy(Session("p1", "A"), 3)) granted++;
    });
  }
  for (auto& t : threads) t.join();

  assert(granted == 3);
  assert(table.CountFor("p1", "A") == 3);
}

void TestGuardReleasesOnScopeExit() {
  OccupancyTable table;
  {
    auto id = table.TryOccupy(Session("p1", "A"), 1);
    assert(id);
    OccupancyGuard guard(table, *id);
    assert(guard.Held());

    OccupancyGuard moved(std::move(guard));
    assert(!guard.Held());
    assert(moved.Held());
    assert(table.Size() == 1);
  }
  assert(table.Size() == 0);
}

} // namespace

int main() {
  TestCapacityIsEnforced();
  TestUnlimitedCapacity();
  TestReleaseIsIdempotent();
  TestSnapshots();
  TestConcurrentOccupyNeverExceedsCapacity();
  TestGuardReleasesOnScopeExit();

  std::cout << "macrelay_unit_occupancy_table: pass\n";
  return 0;
}
