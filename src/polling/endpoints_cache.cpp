// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "polling/endpoints_cache.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace llmmonitor {
namespace polling {

EndpointMap EndpointsCache::Get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoints_;
}

void EndpointsCache::Update(EndpointMap endpoints) {
  std::lock_guard<std::mutex> lock(mutex_);
  endpoints_ = std::move(endpoints);
  last_updated_ = util::GetTime();
  LOG_POLL_DEBUG("Cache updated with {} endpoint(s)", endpoints_.size());
}

size_t EndpointsCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoints_.size();
}

int64_t EndpointsCache::LastUpdated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_updated_;
}

nlohmann::json EndpointsCache::ToJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json j;
  j["endpoints"] = nlohmann::json::object();
  for (const auto &[label, status] : endpoints_) {
    j["endpoints"][label] = status;
  }
  if (last_updated_ > 0) {
    j["updated_at"] = util::FormatISO8601(last_updated_);
  } else {
    j["updated_at"] = nullptr;
  }
  return j;
}

} // namespace polling
} // namespace llmmonitor
