// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_APPLICATION_HPP
#define LLMMONITOR_APPLICATION_HPP

#include "app/app_config.hpp"
#include "discovery/discovery_manager.hpp"
#include "polling/adaptive_poll_controller.hpp"
#include "polling/endpoints_cache.hpp"
#include <atomic>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <thread>

namespace llmmonitor {
namespace app {

/**
 * Application - process-wide context object
 *
 * Built once at startup; owns the discovery manager, the endpoints cache and
 * the poll controller, and wires the controller's refresh to
 * cache.Update(manager.GetCapabilityView().CollectStatus()).
 * Shutdown runs in reverse start order.
 */
class Application {
public:
  // prober overrides the real HTTP probe (tests)
  explicit Application(const AppConfig &config,
                       std::shared_ptr<discovery::HostProber> prober = nullptr);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  bool initialize();
  bool start();
  void stop();

  // Blocks until SIGINT/SIGTERM or request_shutdown()
  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  /**
   * One discovery pass plus one status collection, without background
   * threads. Returns {"hosts": [...], "stats": {...}, "endpoints": {...}}.
   */
  nlohmann::json run_once();

  // Client activity signal for the poll controller
  void tick();

  // Registry stats plus cache freshness
  nlohmann::json health() const;

  discovery::DiscoveryManager &discovery_manager() { return *discovery_manager_; }
  polling::EndpointsCache &endpoints_cache() { return endpoints_cache_; }
  polling::AdaptivePollController &poll_controller() { return *poll_controller_; }

  static Application *instance();

private:
  void refresh_endpoints();
  void shutdown();

  void setup_signal_handlers();
  static void signal_handler(int signal);

  void start_status_reporting();
  void stop_status_reporting();
  void status_loop();

  AppConfig config_;
  std::shared_ptr<discovery::HostProber> prober_;

  std::unique_ptr<discovery::DiscoveryManager> discovery_manager_;
  polling::EndpointsCache endpoints_cache_;
  std::unique_ptr<polling::AdaptivePollController> poll_controller_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::unique_ptr<std::thread> status_thread_;

  static Application *instance_;
};

} // namespace app
} // namespace llmmonitor

#endif // LLMMONITOR_APPLICATION_HPP
