// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_POLLING_ENDPOINTS_CACHE_HPP
#define LLMMONITOR_POLLING_ENDPOINTS_CACHE_HPP

#include "discovery/backend.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace llmmonitor {
namespace polling {

using EndpointMap = std::map<std::string, discovery::ProcessStatus>;

// Last collected backend status per label, shared by all readers
class EndpointsCache {
public:
  EndpointMap Get() const;

  // Replaces the whole map and stamps the update time
  void Update(EndpointMap endpoints);

  size_t Size() const;

  // Unix seconds of the last Update(), 0 if never updated
  int64_t LastUpdated() const;

  // {"endpoints": {label: status, ...}, "updated_at": ISO-8601 or null}
  nlohmann::json ToJson() const;

private:
  mutable std::mutex mutex_;
  EndpointMap endpoints_;
  int64_t last_updated_{0};
};

} // namespace polling
} // namespace llmmonitor

#endif // LLMMONITOR_POLLING_ENDPOINTS_CACHE_HPP
