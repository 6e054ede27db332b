// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_CONFIG_HPP
#define LLMMONITOR_DISCOVERY_CONFIG_HPP

#include "discovery/address_range.hpp"
#include "discovery/host.hpp"
#include "discovery/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace llmmonitor {
namespace discovery {

// Raised for any invalid discovery setting; the process must not start
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * DiscoveryConfig - what to scan and how hard
 *
 * Defaults mirror the environment loader defaults. cidr_ranges has no
 * default and must be set.
 */
struct DiscoveryConfig {
  std::vector<std::string> cidr_ranges;      // normalized by ParseCidrRanges
  std::chrono::seconds interval{60};         // between scan passes, >= 1s
  size_t max_parallel{10};                   // global probe cap, >= 1
  std::chrono::milliseconds timeout{2000};   // per probe stage, > 0
  int port{protocol::DEFAULT_PORT};          // 1..65535

  // Throws ConfigError naming the first offending setting
  void Validate() const;

  // Parsed ranges in configured order (Validate() first)
  std::vector<AddressRange> Ranges() const;
};

/**
 * Parse a comma-separated CIDR list ("192.168.1.0/24, 10.0.0.0/16")
 * Returns normalized ranges; throws ConfigError on an empty list or any
 * invalid item.
 */
std::vector<std::string> ParseCidrRanges(const std::string &ranges);

/**
 * Parse a comma-separated "ip:port" list ("192.168.1.10:11434,[::1]:11434")
 * Each entry is validated individually; throws ConfigError on the first
 * malformed entry.
 */
std::vector<StaticHost> ParseStaticHosts(const std::string &hosts);

// Environment access, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;
EnvLookup ProcessEnvironment();

/**
 * Build a DiscoveryConfig from environment variables:
 *   DISCOVERY_CIDR_RANGES       required
 *   DISCOVERY_INTERVAL_SECONDS  default 60
 *   DISCOVERY_MAX_PARALLEL      default 10
 *   DISCOVERY_TIMEOUT_SECONDS   default 2.0 (fractional)
 *   DISCOVERY_PORT              default 11434
 * Throws ConfigError.
 */
DiscoveryConfig LoadDiscoveryConfig(const EnvLookup &env);

// OLLAMA_HOSTS; empty when unset. Throws ConfigError when malformed.
std::vector<StaticHost> LoadStaticHosts(const EnvLookup &env);

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_CONFIG_HPP
