// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_MANAGER_HPP
#define LLMMONITOR_DISCOVERY_MANAGER_HPP

#include "discovery/address_range.hpp"
#include "discovery/capability_view.hpp"
#include "discovery/discovery_channel.hpp"
#include "discovery/discovery_config.hpp"
#include "discovery/host.hpp"
#include "discovery/host_probe.hpp"
#include "discovery/host_registry.hpp"
#include "discovery/scanner.hpp"
#include "discovery/stream_consumer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <thread>
#include <vector>

namespace llmmonitor {
namespace discovery {

enum class DiscoveryState { IDLE, SCANNING, DRAINING, RECONCILING, STOPPED };

const char *DiscoveryStateToString(DiscoveryState state);

enum class LoopMode {
  PERIODIC, // background thread: pass now, then one pass per interval
  MANUAL    // consumer only; caller drives passes with DiscoverHosts()
};

struct DiscoveryStats {
  size_t total_hosts{0};
  size_t online_hosts{0};
  size_t offline_hosts{0};
  std::vector<std::string> cidr_ranges;
  int64_t scan_interval{0};
  bool is_running{false};
  uint64_t passes_completed{0};
  DiscoveryState state{DiscoveryState::IDLE};
};

void to_json(nlohmann::json &j, const DiscoveryStats &stats);

/**
 * DiscoveryManager - owns the registry and drives scan passes
 *
 * Pass: Scanning (probes stream into the registry through the consumer)
 * -> Draining (channel.Join()) -> Reconciling (everything not confirmed in
 * this pass goes offline) -> Idle. Passes never overlap.
 *
 * Loop errors are logged and retried after ERROR_BACKOFF; only Stop() ends
 * the loop. Stop() interrupts an in-flight pass or wait; the interrupted
 * pass surfaces as DiscoveryCancelled and is not an error.
 *
 * Once stopped the manager cannot be restarted.
 */
class DiscoveryManager {
public:
  static constexpr std::chrono::seconds ERROR_BACKOFF{5};

  // Throws ConfigError when config is invalid. Default prober: HttpHostProbe.
  DiscoveryManager(DiscoveryConfig config,
                   const std::vector<StaticHost> &predefined_hosts = {},
                   std::shared_ptr<HostProber> prober = nullptr);
  ~DiscoveryManager();

  DiscoveryManager(const DiscoveryManager &) = delete;
  DiscoveryManager &operator=(const DiscoveryManager &) = delete;

  // false if already running or stopped
  bool Start(LoopMode mode = LoopMode::PERIODIC);
  void Stop();

  /**
   * Run one full pass on the calling thread and return the hosts confirmed
   * in it. Requires Start(). Throws DiscoveryCancelled when stopped mid-pass.
   */
  std::vector<DiscoveredHost> DiscoverHosts();

  std::vector<DiscoveredHost> GetOnlineHosts() const;
  std::vector<DiscoveredHost> GetAllHosts() const;
  CapabilityView GetCapabilityView() const;

  // Lock-free, best effort
  DiscoveryStats GetStats() const;
  nlohmann::json StatsToJson() const;

  DiscoveryState GetState() const { return state_.load(); }
  bool IsRunning() const { return running_.load(); }
  uint64_t PassesCompleted() const { return passes_completed_.load(); }
  size_t LastPeakInFlight() const { return last_peak_in_flight_.load(); }

  const DiscoveryConfig &GetConfig() const { return config_; }

private:
  void LoopThread();

  // Interruptible sleep; false when stopping
  bool WaitFor(std::chrono::seconds duration);

  void SetState(DiscoveryState next);

  const DiscoveryConfig config_;
  const std::vector<AddressRange> ranges_;
  std::shared_ptr<HostProber> prober_;

  HostRegistry registry_;
  DiscoveryChannel channel_;
  StreamConsumer consumer_;

  std::atomic<bool> running_{false};
  std::atomic<DiscoveryState> state_{DiscoveryState::IDLE};
  std::atomic<uint64_t> passes_completed_{0};
  std::atomic<size_t> last_peak_in_flight_{0};

  std::mutex start_stop_mutex_;
  std::mutex pass_mutex_;

  std::mutex scanner_mutex_;
  std::shared_ptr<BoundedScanner> current_scanner_;

  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  std::thread loop_thread_;
};

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_MANAGER_HPP
