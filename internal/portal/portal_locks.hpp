#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace macrelay::portal {

/*
  One mutex per portal id. Every mutation of a portal (MAC rotation,
  channel refresh) runs under its portal's mutex so probe-driven rotation
  and maintenance jobs never interleave.
*/
class PortalLocks {
 public:
  std::shared_ptr<std::mutex> For(const std::string& portal_id);

 private:
  std::mutex                                                   mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace macrelay::portal
