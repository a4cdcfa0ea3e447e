#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/occupied_session.hpp"
#include "internal/model/portal.hpp"

namespace macrelay::selection {

struct ScoredMac {
  std::string  mac;
  std::int64_t score = 0;
};

/*
  Rates a MAC for a new stream. -1 means at capacity; otherwise higher
  is better (longer idle upstream, more free slots).

  Pure function of its inputs.
*/
std::int64_t ScoreMac(const std::string& mac, const model::MacRecord& record, const std::vector<model::OccupiedSession>& occupied,
                      std::uint32_t streams_per_mac);

// Scores every MAC of the portal, sorted by score descending; ties keep portal order.
std::vector<ScoredMac> ScoreCandidates(const model::Portal& portal, const std::vector<model::OccupiedSession>& occupied);

/*
  Probe order for a request:
    MACs scoring >= 0 by descending score, or every MAC in portal order
    when none does; then MACs known to serve the channel move to the front,
    keeping relative order within both groups.
*/
std::vector<std::string> RankCandidates(const model::Portal& portal, const std::vector<model::OccupiedSession>& occupied,
                                        const std::vector<std::string>& available_macs);

} // namespace macrelay::selection
