#include "portal_store.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace macrelay::portal {

PortalStore::PortalStore(std::shared_ptr<PortalLocks> locks) : locks_(std::move(locks)) {
}

std::shared_ptr<PortalStore> PortalStore::FromConfig(const macrelay::runtime::config::RuntimeConfig& config, std::shared_ptr<PortalLocks> locks) {
  auto store = std::make_shared<PortalStore>(std::move(locks));

  for (const auto& pc : config.portals()) {
    model::Portal portal;
    portal.id              = pc.id();
    portal.name            = pc.name().empty() ? pc.id() : pc.name();
    portal.url             = pc.url();
    portal.proxy           = pc.proxy();
    portal.enabled         = pc.has_enabled() ? pc.enabled() : true;
    portal.streams_per_mac = pc.has_streams_per_mac() ? pc.streams_per_mac() : 1;
    portal.auto_match      = pc.auto_match();

    for (const auto& mc : pc.macs()) {
      model::MacRecord mac;
      mac.mac                      = mc.mac();
      mac.expiry                   = mc.expiry();
      mac.watchdog_timeout_seconds = mc.watchdog_timeout_seconds();
      mac.playback_limit           = mc.playback_limit();
      portal.macs.push_back(std::move(mac));
    }

    store->Upsert(std::move(portal));
  }

  return store;
}

void PortalStore::Upsert(model::Portal portal) {
  auto portal_lock = locks_->For(portal.id);
  std::lock_guard guard(*portal_lock);

  std::unique_lock lock(mutex_);
  if (!portals_.contains(portal.id)) order_.push_back(portal.id);
  const auto id = portal.id;
  portals_[id]  = std::move(portal);
}

std::optional<model::Portal> PortalStore::Get(const std::string& portal_id) const {
  std::shared_lock lock(mutex_);

  auto it = portals_.find(portal_id);
  if (it == portals_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Portal> PortalStore::List() const {
  std::shared_lock lock(mutex_);

  std::vector<model::Portal> out;
  out.reserve(order_.size());
  for (const auto& id : order_) out.push_back(portals_.at(id));
  return out;
}

std::vector<std::string> PortalStore::EnabledPortalIds() const {
  std::shared_lock lock(mutex_);

  std::vector<std::string> out;
  for (const auto& id : order_) {
    if (portals_.at(id).enabled) out.push_back(id);
  }
  return out;
}

void PortalStore::RotateLocked(model::Portal& portal, const std::string& mac) {
  auto it = std::find_if(portal.macs.begin(), portal.macs.end(), [&](const model::MacRecord& r) { return r.mac == mac; });
  if (it == portal.macs.end()) return;

  std::rotate(it, it + 1, portal.macs.end());
}

void PortalStore::MoveMac(const std::string& portal_id, const std::string& mac) {
  MoveMacs(portal_id, {mac});
}

void PortalStore::MoveMacs(const std::string& portal_id, const std::vector<std::string>& macs) {
  if (macs.empty()) return;

  auto portal_lock = locks_->For(portal_id);
  std::lock_guard guard(*portal_lock);

  std::unique_lock lock(mutex_);
  auto it = portals_.find(portal_id);
  if (it == portals_.end()) {
    throw util::NotFound("portal not found: " + portal_id);
  }

  for (const auto& mac : macs) {
    RotateLocked(it->second, mac);
    MACRELAY_LOG_INFO("Moved MAC to end of rotation", {observability::StringField("portal_id", portal_id), observability::StringField("mac", mac)});
  }
}

} // namespace macrelay::portal
