// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license
// Scripted HostProber for scanner and manager tests

#ifndef LLMMONITOR_TEST_SIMULATED_PROBER_HPP
#define LLMMONITOR_TEST_SIMULATED_PROBER_HPP

#include "discovery/discovery_config.hpp"
#include "discovery/host_probe.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace llmmonitor {
namespace test {

/**
 * SimulatedHostProber - answers probes from a table instead of the network
 *
 * Addresses marked live are reported after `latency`; everything else is
 * absent after the same delay. Tracks how many probes are in flight so
 * tests can check the concurrency cap.
 */
class SimulatedHostProber : public discovery::HostProber {
public:
  explicit SimulatedHostProber(
      std::chrono::milliseconds latency = std::chrono::milliseconds(5))
      : latency_(latency) {}

  void SetLive(const std::string &address,
               std::optional<std::string> hostname = std::nullopt) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_[address] = std::move(hostname);
  }

  void SetDead(const std::string &address) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_.erase(address);
  }

  // AsyncProbe throws for this address (scanner must absorb it)
  void SetThrows(const std::string &address) {
    std::lock_guard<std::mutex> lock(mutex_);
    throws_.insert(address);
  }

  void AsyncProbe(std::shared_ptr<boost::asio::io_context> io_context,
                  const std::string &address, uint16_t port,
                  std::chrono::milliseconds timeout,
                  discovery::ProbeCallback callback) override {
    std::optional<discovery::DiscoveryEvent> outcome;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      probed_.push_back(address);
      last_timeout_ = timeout;
      if (throws_.count(address)) {
        throw std::runtime_error("simulated probe failure for " + address);
      }
      auto it = live_.find(address);
      if (it != live_.end()) {
        discovery::DiscoveryEvent event;
        event.address = address;
        event.port = port;
        event.hostname = it->second;
        event.timestamp = util::GetTime();
        outcome = event;
      }
    }

    size_t now = ++in_flight_;
    size_t peak = peak_in_flight_.load();
    while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {
    }

    auto timer = std::make_shared<boost::asio::steady_timer>(*io_context);
    timer->expires_after(latency_);
    timer->async_wait([this, timer, outcome,
                       callback](const boost::system::error_code &) {
      --in_flight_;
      callback(outcome);
    });
  }

  std::vector<std::string> Probed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_;
  }

  size_t ProbeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_.size();
  }

  size_t PeakInFlight() const { return peak_in_flight_.load(); }
  std::chrono::milliseconds LastTimeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_timeout_;
  }

private:
  std::chrono::milliseconds latency_;
  mutable std::mutex mutex_;
  std::map<std::string, std::optional<std::string>> live_;
  std::set<std::string> throws_;
  std::vector<std::string> probed_;
  std::chrono::milliseconds last_timeout_{0};
  std::atomic<size_t> in_flight_{0};
  std::atomic<size_t> peak_in_flight_{0};
};

// Environment lookup backed by a map
inline discovery::EnvLookup MapEnvironment(
    std::map<std::string, std::string> values) {
  return [values = std::move(values)](
             const std::string &name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

} // namespace test
} // namespace llmmonitor

#endif // LLMMONITOR_TEST_SIMULATED_PROBER_HPP
