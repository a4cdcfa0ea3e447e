#include "internal/selection/mac_scorer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using macrelay::model::MacRecord;
using macrelay::model::OccupiedSession;
using macrelay::model::Portal;
using macrelay::selection::RankCandidates;
using macrelay::selection::ScoreCandidates;
using macrelay::selection::ScoreMac;

MacRecord Record(const std::string& mac, std::int64_t watchdog) {
  MacRecord r;
  r.mac                      = mac;
  r.watchdog_timeout_seconds = watchdog;
  return r;
}

OccupiedSession Occupied(const std::string& mac) {
  OccupiedSession s;
  s.portal_id = "p1";
  s.mac       = mac;
  return s;
}

Portal MakePortal(std::uint32_t streams_per_mac, std::vector<MacRecord> macs) {
  Portal p;
  p.id              = "p1";
  p.streams_per_mac = streams_per_mac;
  p.macs            = std::move(macs);
  return p;
}

void TestIdleTiersAndSlots() {
  assert(ScoreMac("A", Record("A", 3600), {}, 2) == 140);
  assert(ScoreMac("A", Record("A", 301), {}, 1) == 95);
  assert(ScoreMac("A", Record("A", 300), {}, 1) == 70);
  assert(ScoreMac("A", Record("A", 60), {}, 1) == 70);
  assert(ScoreMac("A", Record("A", 59), {}, 1) == 30);
  assert(ScoreMac("A", Record("A", 0), {}, 1) == 20);
}

void TestFullMacScoresNegative() {
  assert(ScoreMac("B", Record("B", 0), {Occupied("B")}, 1) == -1);
  assert(ScoreMac("B", Record("B", 4000), {Occupied("B"), Occupied("B")}, 2) == -1);

  // another MAC's sessions do not count
  assert(ScoreMac("A", Record("A", 0), {Occupied("B")}, 1) == 20);
}

void TestUnlimitedStreamsIgnoresSlots() {
  assert(ScoreMac("A", Record("A", 3600), {Occupied("A"), Occupied("A")}, 0) == 100);
}

void TestScoringIsDeterministic() {
  const auto portal = MakePortal(2, {Record("A", 10), Record("B", 4000), Record("C", 10)});
  const std::vector<OccupiedSession> occupied{Occupied("A")};

  const auto first  = ScoreCandidates(portal, occupied);
  const auto second = ScoreCandidates(portal, occupied);
  assert(first.size() == 3);
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(first[i].mac == second[i].mac);
    assert(first[i].score == second[i].score);
  }

  // B: 100 + 40; C: 10 + 40; A: 10 + 20
  assert(first[0].mac == "B" && first[0].score == 140);
  assert(first[1].mac == "C" && first[1].score == 50);
  assert(first[2].mac == "A" && first[2].score == 30);
}

void TestTiesKeepPortalOrder() {
  const auto portal = MakePortal(1, {Record("A", 0), Record("B", 0), Record("C", 0)});
  const auto ranked = RankCandidates(portal, {}, {});
  assert((ranked == std::vector<std::string>{"A", "B", "C"}));
}

void TestFullMacsDropOutOfRanking() {
  // scenario: A is full (1/1), B free
  const auto portal = MakePortal(1, {Record("A", 4000), Record("B", 0)});
  const auto ranked = RankCandidates(portal, {Occupied("A")}, {});
  assert((ranked == std::vector<std::string>{"B"}));
}

void TestAllFullFallsBackToPortalOrder() {
  const auto portal = MakePortal(1, {Record("A", 0), Record("B", 4000)});
  const auto ranked = RankCandidates(portal, {Occupied("A"), Occupied("B")}, {});
  assert((ranked == std::vector<std::string>{"A", "B"}));
}

void TestAvailableMacsMoveToFront() {
  const auto portal = MakePortal(1, {Record("A", 4000), Record("B", 400), Record("C", 10), Record("D", 0)});
  const auto ranked = RankCandidates(portal, {}, {"D", "B"});

  // preferred MACs keep score order among themselves, and so do the rest
  assert((ranked == std::vector<std::string>{"B", "D", "A", "C"}));
}

} // namespace

int main() {
  TestIdleTiersAndSlots();
  TestFullMacScoresNegative();
  TestUnlimitedStreamsIgnoresSlots();
  TestScoringIsDeterministic();
  TestTiesKeepPortalOrder();
  TestFullMacsDropOutOfRanking();
  TestAllFullFallsBackToPortalOrder();
  TestAvailableMacsMoveToFront();

  std::cout << "macrelay_unit_mac_scorer: pass\n";
  return 0;
}
