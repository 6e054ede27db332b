// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/host_registry.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace llmmonitor {
namespace discovery {

void HostRegistry::AddPredefined(const std::vector<StaticHost> &hosts) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : hosts) {
    if (hosts_.count(entry.address)) {
      LOG_DISC_WARN("Predefined host {} listed more than once; keeping the "
                    "first entry",
                    entry.address);
      continue;
    }
    DiscoveredHost host;
    host.address = entry.address;
    host.port = entry.port;
    host.last_seen = util::GetTime();
    host.is_online = false;
    host.is_predefined = true;
    hosts_.emplace(entry.address, std::move(host));
    LOG_DISC_INFO("Predefined host added to registry: {}:{}", entry.address,
                  entry.port);
  }
  RefreshDerivedLocked();
}

MergeOutcome HostRegistry::Merge(const DiscoveryEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);

  MergeOutcome outcome;
  auto it = hosts_.find(event.address);
  if (it == hosts_.end()) {
    hosts_.emplace(event.address, event.ToHost());
    LOG_DISC_INFO("New host immediately available: {}:{}", event.address,
                  event.port);
    outcome = MergeOutcome::INSERTED;
  } else {
    DiscoveredHost &existing = it->second;
    outcome = existing.SameEndpoint(event.address, event.port)
                  ? MergeOutcome::UPDATED
                  : MergeOutcome::REPLACED;
    if (outcome == MergeOutcome::REPLACED) {
      LOG_DISC_INFO("Host {} moved from port {} to {}", event.address,
                    existing.port, event.port);
      existing.port = event.port;
    } else {
      LOG_DISC_DEBUG("Updated existing host: {}:{}", event.address, event.port);
    }
    existing.last_seen = event.timestamp;
    existing.is_online = true;
    if (event.hostname) {
      existing.hostname = event.hostname;
    }
  }

  RefreshDerivedLocked();
  return outcome;
}

size_t HostRegistry::Reconcile(const std::set<std::string> &confirmed) {
  std::lock_guard<std::mutex> lock(mutex_);

  size_t went_offline = 0;
  for (auto &[address, host] : hosts_) {
    if (confirmed.count(address)) {
      continue;
    }
    if (host.is_online) {
      host.is_online = false;
      ++went_offline;
      LOG_DISC_INFO("Host marked as offline: {}", address);
    }
  }

  RefreshDerivedLocked();
  LOG_DISC_INFO("Reconciled registry: {} online, {} newly offline, {} total",
                online_.load(), went_offline, hosts_.size());
  return went_offline;
}

std::vector<DiscoveredHost> HostRegistry::GetOnlineHosts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DiscoveredHost> out;
  for (const auto &[address, host] : hosts_) {
    if (host.is_online) {
      out.push_back(host);
    }
  }
  return out;
}

std::vector<DiscoveredHost> HostRegistry::GetAllHosts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DiscoveredHost> out;
  out.reserve(hosts_.size());
  for (const auto &[address, host] : hosts_) {
    out.push_back(host);
  }
  return out;
}

std::optional<DiscoveredHost>
HostRegistry::Find(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(address);
  if (it == hosts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

CapabilityView HostRegistry::GetCapabilityView() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return view_;
}

void HostRegistry::RefreshDerivedLocked() {
  std::vector<DiscoveredHost> all;
  all.reserve(hosts_.size());
  size_t online = 0;
  for (const auto &[address, host] : hosts_) {
    all.push_back(host);
    if (host.is_online) {
      ++online;
    }
  }
  view_.Refresh(all);
  total_.store(hosts_.size(), std::memory_order_relaxed);
  online_.store(online, std::memory_order_relaxed);
}

} // namespace discovery
} // namespace llmmonitor
