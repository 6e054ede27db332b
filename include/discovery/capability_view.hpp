// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_CAPABILITY_VIEW_HPP
#define LLMMONITOR_DISCOVERY_CAPABILITY_VIEW_HPP

#include "discovery/backend.hpp"
#include "discovery/host.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace llmmonitor {
namespace discovery {

/**
 * CapabilityView - label -> backend handle for every registry entry
 *
 * Rebuilt from the full registry (online and offline) after every registry
 * change. A copy shares the backend handles, so a snapshot taken under the
 * registry lock can be probed later without holding it.
 */
class CapabilityView {
public:
  void Refresh(const std::vector<DiscoveredHost> &hosts,
               BackendType type = BackendType::OLLAMA);

  size_t Size() const { return backends_.size(); }
  bool Empty() const { return backends_.empty(); }
  std::vector<std::string> Labels() const;
  std::shared_ptr<const Backend> Find(const std::string &label) const;

  // Probe every backend sequentially; failures become offline entries
  std::map<std::string, ProcessStatus> CollectStatus() const;

private:
  std::map<std::string, std::shared_ptr<const Backend>> backends_;
};

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_CAPABILITY_VIEW_HPP
