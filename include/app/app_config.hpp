// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_APP_CONFIG_HPP
#define LLMMONITOR_APP_CONFIG_HPP

#include "discovery/discovery_config.hpp"
#include "discovery/host.hpp"
#include "polling/adaptive_poll_controller.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace llmmonitor {
namespace app {

struct AppConfig {
  discovery::DiscoveryConfig discovery;
  std::vector<discovery::StaticHost> static_hosts;
  polling::PollConfig poll;

  // Single pass, print JSON, exit
  bool run_once{false};

  // How often the running service logs registry stats
  std::chrono::seconds status_interval{60};

  std::string log_level{"info"};
  std::vector<std::string> debug_components;
  std::string log_file; // empty: console
};

struct CommandLine {
  AppConfig config;
  bool show_help{false};
  bool show_version{false};

  // Environment variable name -> value given on the command line
  std::map<std::string, std::string> env_overrides;
};

/**
 * Parse argv. Discovery flags are recorded as overrides of the matching
 * environment variables and only validated by LoadEnvironment():
 *   --cidr=      DISCOVERY_CIDR_RANGES
 *   --interval=  DISCOVERY_INTERVAL_SECONDS
 *   --parallel=  DISCOVERY_MAX_PARALLEL
 *   --timeout=   DISCOVERY_TIMEOUT_SECONDS
 *   --port=      DISCOVERY_PORT
 *   --hosts=     OLLAMA_HOSTS
 * --help and --version stop parsing.
 *
 * Throws discovery::ConfigError on unknown options or invalid values.
 */
CommandLine ParseCommandLine(int argc, const char *const argv[]);

/**
 * Fill config.discovery and config.static_hosts from the environment with
 * the command line overrides on top. Throws discovery::ConfigError.
 */
void LoadEnvironment(CommandLine &cli, const discovery::EnvLookup &env);

std::string UsageText(const std::string &program_name);

} // namespace app
} // namespace llmmonitor

#endif // LLMMONITOR_APP_CONFIG_HPP
