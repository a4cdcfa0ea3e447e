#pragma once

#include <chrono>
#include <string>

namespace macrelay::model {

/*
  One live direct-delivery stream holding a slot on a MAC.
*/
struct OccupiedSession {
  std::string                           id;
  std::string                           portal_id;
  std::string                           mac;
  std::string                           channel_id;
  std::string                           channel_name;
  std::string                           client_addr;
  std::chrono::system_clock::time_point start_time{};
};

} // namespace macrelay::model
