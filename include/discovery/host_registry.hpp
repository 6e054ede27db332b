// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_HOST_REGISTRY_HPP
#define LLMMONITOR_DISCOVERY_HOST_REGISTRY_HPP

#include "discovery/capability_view.hpp"
#include "discovery/host.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace llmmonitor {
namespace discovery {

enum class MergeOutcome {
  INSERTED, // first confirmation of a dynamic address
  UPDATED,  // same address and port seen again
  REPLACED  // same address answered on a different port
};

/**
 * HostRegistry - address -> DiscoveredHost, plus the capability view
 * derived from it
 *
 * At most one record per address. Records are never removed; absence only
 * turns them offline. Every writer refreshes the capability view before
 * releasing the lock, so readers never see the two out of step.
 *
 * Readers get copies. Total()/Online() are lock-free counters kept in sync by
 * the writers.
 */
class HostRegistry {
public:
  HostRegistry() = default;
  HostRegistry(const HostRegistry &) = delete;
  HostRegistry &operator=(const HostRegistry &) = delete;

  // Offline, predefined records; duplicates of an address are ignored
  void AddPredefined(const std::vector<StaticHost> &hosts);

  MergeOutcome Merge(const DiscoveryEvent &event);

  /**
   * Set every record whose address is not in confirmed offline
   * Returns the number of records that went from online to offline.
   * Calling it again with the same set changes nothing.
   */
  size_t Reconcile(const std::set<std::string> &confirmed);

  std::vector<DiscoveredHost> GetOnlineHosts() const;
  std::vector<DiscoveredHost> GetAllHosts() const;
  std::optional<DiscoveredHost> Find(const std::string &address) const;
  CapabilityView GetCapabilityView() const;

  size_t Total() const { return total_.load(std::memory_order_relaxed); }
  size_t Online() const { return online_.load(std::memory_order_relaxed); }

private:
  // Caller holds mutex_
  void RefreshDerivedLocked();

  mutable std::mutex mutex_;
  std::map<std::string, DiscoveredHost> hosts_;
  CapabilityView view_;

  std::atomic<size_t> total_{0};
  std::atomic<size_t> online_{0};
};

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_HOST_REGISTRY_HPP
