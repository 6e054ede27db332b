// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/capability_view.hpp"
#include "util/logging.hpp"

namespace llmmonitor {
namespace discovery {

void CapabilityView::Refresh(const std::vector<DiscoveredHost> &hosts,
                             BackendType type) {
  std::map<std::string, std::shared_ptr<const Backend>> rebuilt;
  for (const auto &host : hosts) {
    try {
      auto backend = MakeBackend(type, host);
      auto [it, inserted] = rebuilt.insert_or_assign(backend->Label(), backend);
      if (!inserted) {
        LOG_DISC_DEBUG("Backend label '{}' reused by {}:{}", it->first,
                       host.address, host.port);
      }
    } catch (const std::exception &e) {
      LOG_DISC_ERROR("Failed to create backend for {}:{}: {}", host.address,
                     host.port, e.what());
    }
  }
  backends_ = std::move(rebuilt);
  LOG_DISC_DEBUG("Capability view refreshed: {} backend(s)", backends_.size());
}

std::vector<std::string> CapabilityView::Labels() const {
  std::vector<std::string> labels;
  labels.reserve(backends_.size());
  for (const auto &[label, backend] : backends_) {
    labels.push_back(label);
  }
  return labels;
}

std::shared_ptr<const Backend>
CapabilityView::Find(const std::string &label) const {
  auto it = backends_.find(label);
  if (it == backends_.end()) {
    return nullptr;
  }
  return it->second;
}

std::map<std::string, ProcessStatus> CapabilityView::CollectStatus() const {
  LOG_INFO("Fetching status of {} backend(s)", backends_.size());
  std::map<std::string, ProcessStatus> endpoints;
  for (const auto &[label, backend] : backends_) {
    try {
      endpoints[label] = backend->Probe();
    } catch (const std::exception &e) {
      LOG_ERROR("Failed to get status of backend {}: {}", label, e.what());
      endpoints[label] =
          ProcessStatus::Offline(backend->Address(), backend->Port());
    }
  }
  LOG_INFO("Fetched status of {} endpoint(s)", endpoints.size());
  return endpoints;
}

} // namespace discovery
} // namespace llmmonitor
