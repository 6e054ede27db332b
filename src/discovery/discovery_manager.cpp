// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/discovery_manager.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>
#include <set>

namespace llmmonitor {
namespace discovery {

namespace {

std::vector<AddressRange> ValidatedRanges(const DiscoveryConfig &config) {
  config.Validate();
  return config.Ranges();
}

} // namespace

const char *DiscoveryStateToString(DiscoveryState state) {
  switch (state) {
  case DiscoveryState::IDLE:
    return "idle";
  case DiscoveryState::SCANNING:
    return "scanning";
  case DiscoveryState::DRAINING:
    return "draining";
  case DiscoveryState::RECONCILING:
    return "reconciling";
  case DiscoveryState::STOPPED:
    return "stopped";
  }
  return "unknown";
}

void to_json(nlohmann::json &j, const DiscoveryStats &stats) {
  j = nlohmann::json{{"total_hosts", stats.total_hosts},
                     {"online_hosts", stats.online_hosts},
                     {"offline_hosts", stats.offline_hosts},
                     {"cidr_ranges", stats.cidr_ranges},
                     {"scan_interval", stats.scan_interval},
                     {"is_running", stats.is_running},
                     {"passes_completed", stats.passes_completed},
                     {"state", DiscoveryStateToString(stats.state)}};
}

DiscoveryManager::DiscoveryManager(DiscoveryConfig config,
                                   const std::vector<StaticHost> &predefined_hosts,
                                   std::shared_ptr<HostProber> prober)
    : config_(std::move(config)), ranges_(ValidatedRanges(config_)),
      prober_(prober ? std::move(prober) : std::make_shared<HttpHostProbe>()),
      consumer_(channel_, registry_) {
  LOG_DISC_INFO("DiscoveryManager initialized with {} CIDR range(s)",
                ranges_.size());

  if (predefined_hosts.empty()) {
    LOG_DISC_DEBUG("No predefined hosts configured");
  } else {
    registry_.AddPredefined(predefined_hosts);
    LOG_DISC_INFO("Initialized {} predefined host(s)", registry_.Total());
  }
}

DiscoveryManager::~DiscoveryManager() { Stop(); }

bool DiscoveryManager::Start(LoopMode mode) {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load() || state_.load() == DiscoveryState::STOPPED) {
    return false;
  }

  running_.store(true);
  consumer_.Start();

  if (mode == LoopMode::PERIODIC) {
    LOG_DISC_INFO("Starting discovery system (interval: {}s)",
                  config_.interval.count());
    loop_thread_ = std::thread([this]() { LoopThread(); });
  } else {
    LOG_DISC_INFO("Discovery started in manual mode");
  }
  return true;
}

void DiscoveryManager::Stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (state_.load() == DiscoveryState::STOPPED) {
    return;
  }
  LOG_DISC_INFO("Stopping discovery manager");

  running_.store(false);
  {
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);
  }
  wait_cv_.notify_all();

  {
    std::lock_guard<std::mutex> scanner_lock(scanner_mutex_);
    if (current_scanner_) {
      current_scanner_->Cancel();
    }
  }

  channel_.Close();
  consumer_.Stop();

  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }

  state_.store(DiscoveryState::STOPPED);
  LOG_DISC_INFO("Discovery manager stopped");
}

void DiscoveryManager::SetState(DiscoveryState next) {
  auto current = state_.load();
  while (current != DiscoveryState::STOPPED &&
         !state_.compare_exchange_weak(current, next)) {
  }
}

std::vector<DiscoveredHost> DiscoveryManager::DiscoverHosts() {
  if (!running_.load()) {
    throw std::runtime_error("discovery manager is not running");
  }

  std::lock_guard<std::mutex> pass_lock(pass_mutex_);
  LOG_DISC_INFO("Starting discovery scan");

  auto scanner = std::make_shared<BoundedScanner>(
      *prober_, config_.max_parallel, config_.timeout,
      static_cast<uint16_t>(config_.port));
  {
    std::lock_guard<std::mutex> lock(scanner_mutex_);
    if (!running_.load()) {
      throw DiscoveryCancelled("discovery stopped before scan");
    }
    current_scanner_ = scanner;
  }

  // Back to Idle and scanner released however the pass ends
  struct PassGuard {
    DiscoveryManager &manager;
    ~PassGuard() {
      {
        std::lock_guard<std::mutex> lock(manager.scanner_mutex_);
        manager.current_scanner_.reset();
      }
      manager.SetState(DiscoveryState::IDLE);
    }
  } guard{*this};

  SetState(DiscoveryState::SCANNING);
  ScanResult result = scanner->Scan(ranges_, &channel_);
  last_peak_in_flight_.store(result.peak_in_flight);

  SetState(DiscoveryState::DRAINING);
  if (!channel_.Join()) {
    throw DiscoveryCancelled("discovery stopped while draining");
  }
  LOG_DISC_DEBUG("All queued hosts processed");

  SetState(DiscoveryState::RECONCILING);
  std::set<std::string> confirmed;
  std::vector<DiscoveredHost> hosts;
  hosts.reserve(result.found.size());
  for (const auto &event : result.found) {
    confirmed.insert(event.address);
    hosts.push_back(event.ToHost());
  }
  size_t went_offline = registry_.Reconcile(confirmed);
  ++passes_completed_;

  LOG_DISC_INFO("Discovery scan complete: {} online, {} went offline, {} total",
                registry_.Online(), went_offline, registry_.Total());
  return hosts;
}

void DiscoveryManager::LoopThread() {
  bool first_pass = true;
  bool after_error = false;

  while (running_.load()) {
    if (!first_pass) {
      if (!WaitFor(after_error ? ERROR_BACKOFF : config_.interval)) {
        break;
      }
    }
    first_pass = false;
    after_error = false;

    try {
      DiscoverHosts();
    } catch (const DiscoveryCancelled &e) {
      LOG_DISC_DEBUG("Discovery pass cancelled: {}", e.what());
    } catch (const std::exception &e) {
      LOG_DISC_ERROR("Error in discovery loop: {}", e.what());
      after_error = true;
    }
  }

  LOG_DISC_INFO("Discovery loop stopped");
}

bool DiscoveryManager::WaitFor(std::chrono::seconds duration) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  wait_cv_.wait_for(lock, duration, [this] { return !running_.load(); });
  return running_.load();
}

std::vector<DiscoveredHost> DiscoveryManager::GetOnlineHosts() const {
  return registry_.GetOnlineHosts();
}

std::vector<DiscoveredHost> DiscoveryManager::GetAllHosts() const {
  return registry_.GetAllHosts();
}

CapabilityView DiscoveryManager::GetCapabilityView() const {
  return registry_.GetCapabilityView();
}

DiscoveryStats DiscoveryManager::GetStats() const {
  DiscoveryStats stats;
  stats.total_hosts = registry_.Total();
  stats.online_hosts = registry_.Online();
  stats.offline_hosts = stats.total_hosts >= stats.online_hosts
                            ? stats.total_hosts - stats.online_hosts
                            : 0;
  stats.cidr_ranges = config_.cidr_ranges;
  stats.scan_interval = config_.interval.count();
  stats.is_running = running_.load();
  stats.passes_completed = passes_completed_.load();
  stats.state = state_.load();
  return stats;
}

nlohmann::json DiscoveryManager::StatsToJson() const {
  return nlohmann::json(GetStats());
}

} // namespace discovery
} // namespace llmmonitor
