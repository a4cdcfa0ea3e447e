#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/portal.hpp"
#include "portal_locks.hpp"

namespace macrelay::portal {

/*
  In-memory portal table seeded from config.

  Readers get snapshots; the only mutation the engine performs is MAC
  rotation, serialized through the per-portal lock.
*/
class PortalStore {
 public:
  explicit PortalStore(std::shared_ptr<PortalLocks> locks);

  static std::shared_ptr<PortalStore> FromConfig(const macrelay::runtime::config::RuntimeConfig& config, std::shared_ptr<PortalLocks> locks);

  void Upsert(model::Portal portal);

  std::optional<model::Portal> Get(const std::string& portal_id) const;
  std::vector<model::Portal>   List() const;
  std::vector<std::string>     EnabledPortalIds() const;

  // Moves mac to the end of the portal's sequence. Unknown MACs are ignored.
  void MoveMac(const std::string& portal_id, const std::string& mac);

  // Rotates every MAC in macs, in order, under one lock acquisition.
  void MoveMacs(const std::string& portal_id, const std::vector<std::string>& macs);

 private:
  static void RotateLocked(model::Portal& portal, const std::string& mac);

  std::shared_ptr<PortalLocks>                   locks_;
  mutable std::shared_mutex                      mutex_;
  std::unordered_map<std::string, model::Portal> portals_;
  std::vector<std::string>                       order_;
};

} // namespace macrelay::portal
