// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_SCANNER_HPP
#define LLMMONITOR_DISCOVERY_SCANNER_HPP

#include "discovery/address_range.hpp"
#include "discovery/discovery_channel.hpp"
#include "discovery/host_probe.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace llmmonitor {
namespace discovery {

// A scan pass or drain was interrupted by Stop()
class DiscoveryCancelled : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ScanResult {
  std::vector<DiscoveryEvent> found; // probe-completion order
  uint64_t probed{0};
  size_t peak_in_flight{0};
};

/**
 * BoundedScanner - one scan pass over every range
 *
 * All candidates of all ranges share one gate of max_parallel slots, so the
 * number of probes in flight never exceeds the cap no matter how many ranges
 * are configured. Candidates are pulled lazily from AddressRange::At().
 *
 * Scan() runs a private io_context on the calling thread and returns once
 * every candidate has an outcome. Confirmed hosts are pushed to the channel
 * (when given) as they complete. Cancel() is safe from any thread; the
 * interrupted Scan() throws DiscoveryCancelled.
 *
 * One instance per pass.
 */
class BoundedScanner {
public:
  BoundedScanner(HostProber &prober, size_t max_parallel,
                 std::chrono::milliseconds timeout, uint16_t port);

  BoundedScanner(const BoundedScanner &) = delete;
  BoundedScanner &operator=(const BoundedScanner &) = delete;

  ScanResult Scan(const std::vector<AddressRange> &ranges,
                  DiscoveryChannel *channel = nullptr);

  void Cancel();
  bool IsCancelled() const { return cancelled_.load(); }

private:
  bool NextCandidate(std::string &out);
  void LaunchNext();
  void OnProbeComplete(std::optional<DiscoveryEvent> event);

  HostProber &prober_;
  const size_t max_parallel_;
  const std::chrono::milliseconds timeout_;
  const uint16_t port_;

  std::atomic<bool> cancelled_{false};
  std::mutex io_mutex_;
  std::shared_ptr<boost::asio::io_context> io_context_;

  // Pass state, io_context thread only
  const std::vector<AddressRange> *ranges_{nullptr};
  DiscoveryChannel *channel_{nullptr};
  size_t range_index_{0};
  uint64_t offset_{0};
  size_t in_flight_{0};
  ScanResult result_;
};

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_SCANNER_HPP
