// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <iostream> // Keep for signal handler and startup banner
#include <nlohmann/json.hpp>

namespace llmmonitor {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config,
                         std::shared_ptr<discovery::HostProber> prober)
    : config_(config), prober_(std::move(prober)) {
  instance_ = this;
}

Application::~Application() {
  stop();
  if (discovery_manager_) {
    discovery_manager_->Stop();
  }
  if (poll_controller_) {
    poll_controller_->Stop();
  }
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  // Print startup banner (stdout stays clean for --once JSON)
  if (!config_.run_once) {
    std::cout << GetStartupBanner(config_.discovery.cidr_ranges.size(),
                                  config_.static_hosts.size())
              << std::flush;
  }

  LOG_APP_INFO("Initializing LLM Monitor...");

  try {
    discovery_manager_ = std::make_unique<discovery::DiscoveryManager>(
        config_.discovery, config_.static_hosts, prober_);
    poll_controller_ =
        std::make_unique<polling::AdaptivePollController>(config_.poll);
  } catch (const discovery::ConfigError &e) {
    LOG_APP_ERROR("Invalid discovery configuration: {}", e.what());
    return false;
  } catch (const std::invalid_argument &e) {
    LOG_APP_ERROR("Invalid polling configuration: {}", e.what());
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!discovery_manager_ || !poll_controller_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  LOG_APP_INFO("Starting LLM Monitor...");
  setup_signal_handlers();

  if (!discovery_manager_->Start(discovery::LoopMode::PERIODIC)) {
    LOG_APP_ERROR("Failed to start discovery manager");
    return false;
  }

  if (!poll_controller_->Start([this]() { refresh_endpoints(); })) {
    LOG_APP_ERROR("Failed to start poll controller");
    discovery_manager_->Stop();
    return false;
  }

  running_ = true;
  start_status_reporting();

  LOG_APP_INFO("LLM Monitor started successfully");
  for (const auto &cidr : config_.discovery.cidr_ranges) {
    LOG_APP_INFO("Scanning: {} port {}", cidr, config_.discovery.port);
  }
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down LLM Monitor...");
  running_ = false;

  stop_status_reporting();

  if (poll_controller_) {
    LOG_APP_INFO("Stopping poll controller...");
    poll_controller_->Stop();
  }

  if (discovery_manager_) {
    LOG_APP_INFO("Stopping discovery manager...");
    discovery_manager_->Stop();
  }

  LOG_APP_INFO("Shutdown complete");
}

nlohmann::json Application::run_once() {
  if (!discovery_manager_) {
    throw std::runtime_error("Application not initialized");
  }

  discovery_manager_->Start(discovery::LoopMode::MANUAL);
  discovery_manager_->DiscoverHosts();
  refresh_endpoints();

  nlohmann::json out;
  out["hosts"] = discovery_manager_->GetAllHosts();
  out["stats"] = discovery_manager_->StatsToJson();
  out["endpoints"] = endpoints_cache_.ToJson()["endpoints"];

  discovery_manager_->Stop();
  return out;
}

void Application::tick() {
  if (poll_controller_) {
    poll_controller_->Tick();
  }
}

nlohmann::json Application::health() const {
  nlohmann::json j;
  j["status"] = running_ ? "healthy" : "stopped";
  j["version"] = GetVersionString();
  if (discovery_manager_) {
    j["discovery"] = discovery_manager_->StatsToJson();
  }
  int64_t updated = endpoints_cache_.LastUpdated();
  if (updated > 0) {
    j["endpoints_updated_at"] = util::FormatISO8601(updated);
  } else {
    j["endpoints_updated_at"] = nullptr;
  }
  j["endpoints_cached"] = endpoints_cache_.Size();
  return j;
}

void Application::refresh_endpoints() {
  auto view = discovery_manager_->GetCapabilityView();
  endpoints_cache_.Update(view.CollectStatus());
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    std::cout << "\nReceived signal " << signal << std::endl;
    instance_->shutdown_requested_ = true;
  }
}

void Application::start_status_reporting() {
  LOG_APP_INFO("Reporting status every {}s", config_.status_interval.count());
  status_thread_ =
      std::make_unique<std::thread>(&Application::status_loop, this);
}

void Application::stop_status_reporting() {
  if (status_thread_ && status_thread_->joinable()) {
    LOG_APP_INFO("Stopping status reporting thread");
    status_thread_->join();
    status_thread_.reset();
  }
}

void Application::status_loop() {
  using namespace std::chrono;
  auto last_report = steady_clock::now();

  while (running_) {
    std::this_thread::sleep_for(seconds(1));
    if (!running_)
      break;

    auto now = steady_clock::now();
    if (now - last_report >= config_.status_interval) {
      LOG_APP_INFO("Status: {}", health().dump());
      last_report = now;
    }
  }
}

} // namespace app
} // namespace llmmonitor
