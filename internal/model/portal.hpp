#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace macrelay::model {

struct MacRecord {
  std::string mac;
  std::string expiry;

  // seconds the credential has sat idle upstream; 0 means unknown
  std::int64_t watchdog_timeout_seconds = 0;

  // advisory only, capacity is enforced through streams_per_mac
  std::int32_t playback_limit = 0;
};

/*
  A portal and its credential pool. MACs are an ordered sequence; the
  front is tried first and rotation moves a MAC to the back.
*/
struct Portal {
  std::string id;
  std::string name;
  std::string url;
  std::string proxy;
  bool        enabled = true;

  // 0 = unlimited
  std::uint32_t streams_per_mac = 1;

  bool auto_match = false;

  std::vector<MacRecord> macs;
};

} // namespace macrelay::model
