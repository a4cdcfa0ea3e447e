#include "mac_scorer.hpp"

#include <algorithm>

namespace macrelay::selection {

namespace {

std::int64_t IdleTierScore(std::int64_t watchdog_seconds) {
  if (watchdog_seconds > 1800) return 100;
  if (watchdog_seconds > 300) return 75;
  if (watchdog_seconds >= 60) return 50;
  if (watchdog_seconds > 0) return 10;
  return 0;
}

} // namespace

std::int64_t ScoreMac(const std::string& mac, const model::MacRecord& record, const std::vector<model::OccupiedSession>& occupied,
                      std::uint32_t streams_per_mac) {
  const auto current_streams = static_cast<std::int64_t>(
      std::count_if(occupied.begin(), occupied.end(), [&](const model::OccupiedSession& s) { return s.mac == mac; }));
  const auto available_slots = static_cast<std::int64_t>(streams_per_mac) - current_streams;

  if (streams_per_mac != 0 && available_slots <= 0) return -1;

  std::int64_t score = IdleTierScore(record.watchdog_timeout_seconds);
  if (streams_per_mac != 0) score += available_slots * 20;
  return score;
}

std::vector<ScoredMac> ScoreCandidates(const model::Portal& portal, const std::vector<model::OccupiedSession>& occupied) {
  std::vector<ScoredMac> scored;
  scored.reserve(portal.macs.size());
  for (const auto& record : portal.macs) {
    scored.push_back({record.mac, ScoreMac(record.mac, record, occupied, portal.streams_per_mac)});
  }

  std::stable_sort(scored.begin(), scored.end(), [](const ScoredMac& a, const ScoredMac& b) { return a.score > b.score; });
  return scored;
}

std::vector<std::string> RankCandidates(const model::Portal& portal, const std::vector<model::OccupiedSession>& occupied,
                                        const std::vector<std::string>& available_macs) {
  std::vector<std::string> ordered;
  for (const auto& s : ScoreCandidates(portal, occupied)) {
    if (s.score >= 0) ordered.push_back(s.mac);
  }

  // every MAC at capacity: fall back to portal order as a last resort
  if (ordered.empty()) {
    for (const auto& record : portal.macs) ordered.push_back(record.mac);
  }

  if (!available_macs.empty()) {
    std::stable_partition(ordered.begin(), ordered.end(), [&](const std::string& mac) {
      return std::find(available_macs.begin(), available_macs.end(), mac) != available_macs.end();
    });
  }
  return ordered;
}

} // namespace macrelay::selection
