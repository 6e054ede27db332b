// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/discovery_config.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <cmath>
#include <cstdlib>

namespace llmmonitor {
namespace discovery {

namespace {

void CheckScanSize(const AddressRange &range) {
  if (range.Size() > protocol::MAX_SCAN_CANDIDATES) {
    throw ConfigError("CIDR range " + range.ToString() +
                      " is too large to scan (" + std::to_string(range.Size()) +
                      " candidates, limit " +
                      std::to_string(protocol::MAX_SCAN_CANDIDATES) + ")");
  }
}

} // namespace

void DiscoveryConfig::Validate() const {
  if (cidr_ranges.empty()) {
    throw ConfigError("at least one CIDR range is required");
  }
  for (const auto &cidr : cidr_ranges) {
    auto range = AddressRange::TryParse(cidr);
    if (!range) {
      throw ConfigError("invalid CIDR range '" + cidr + "'");
    }
    CheckScanSize(*range);
  }
  if (interval < std::chrono::seconds(1)) {
    throw ConfigError("scan interval must be at least 1 second, got " +
                      std::to_string(interval.count()));
  }
  if (max_parallel < 1) {
    throw ConfigError("max parallel probes must be at least 1");
  }
  if (timeout <= std::chrono::milliseconds::zero()) {
    throw ConfigError("probe timeout must be positive, got " +
                      std::to_string(timeout.count()) + "ms");
  }
  if (port < 1 || port > 65535) {
    throw ConfigError("port must be between 1 and 65535, got " +
                      std::to_string(port));
  }
}

std::vector<AddressRange> DiscoveryConfig::Ranges() const {
  std::vector<AddressRange> out;
  out.reserve(cidr_ranges.size());
  for (const auto &cidr : cidr_ranges) {
    out.push_back(AddressRange::Parse(cidr));
  }
  return out;
}

std::vector<std::string> ParseCidrRanges(const std::string &ranges) {
  auto items = util::SplitAndTrim(ranges, ',');
  if (items.empty()) {
    throw ConfigError("CIDR ranges string is empty");
  }

  std::vector<std::string> validated;
  validated.reserve(items.size());
  for (const auto &item : items) {
    std::optional<AddressRange> range;
    try {
      range = AddressRange::Parse(item);
    } catch (const std::invalid_argument &e) {
      throw ConfigError("Invalid CIDR range '" + item + "': " + e.what());
    }
    CheckScanSize(*range);
    validated.push_back(range->ToString());
    LOG_DISC_DEBUG("Validated CIDR range: {}", validated.back());
  }
  return validated;
}

std::vector<StaticHost> ParseStaticHosts(const std::string &hosts) {
  auto items = util::SplitAndTrim(hosts, ',');
  if (items.empty()) {
    throw ConfigError("static host list is empty");
  }

  std::vector<StaticHost> validated;
  validated.reserve(items.size());
  for (const auto &item : items) {
    StaticHost host;
    if (!util::ParseIPPort(item, host.address, host.port)) {
      throw ConfigError("Invalid static host '" + item +
                        "': expected ip:port with port 1-65535");
    }
    LOG_DISC_DEBUG("Validated static host: {}:{}", host.address, host.port);
    validated.push_back(host);
  }
  return validated;
}

EnvLookup ProcessEnvironment() {
  return [](const std::string &name) -> std::optional<std::string> {
    const char *value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

namespace {

int64_t ReadInt(const EnvLookup &env, const std::string &name,
                int64_t fallback) {
  auto raw = env(name);
  if (!raw || raw->empty()) {
    return fallback;
  }
  auto value = util::SafeParseInt(*raw);
  if (!value) {
    throw ConfigError(name + " must be an integer, got '" + *raw + "'");
  }
  return *value;
}

} // namespace

DiscoveryConfig LoadDiscoveryConfig(const EnvLookup &env) {
  LOG_DISC_INFO("Loading discovery configuration from environment variables");

  auto ranges = env("DISCOVERY_CIDR_RANGES");
  if (!ranges || ranges->empty()) {
    throw ConfigError("Required environment variable DISCOVERY_CIDR_RANGES is "
                      "not set. Example: "
                      "DISCOVERY_CIDR_RANGES=192.168.1.0/24,10.0.0.0/16");
  }

  DiscoveryConfig config;
  config.cidr_ranges = ParseCidrRanges(*ranges);

  int64_t interval = ReadInt(env, "DISCOVERY_INTERVAL_SECONDS", 60);
  if (interval < 1) {
    throw ConfigError("DISCOVERY_INTERVAL_SECONDS must be at least 1, got " +
                      std::to_string(interval));
  }
  config.interval = std::chrono::seconds(interval);

  int64_t parallel = ReadInt(env, "DISCOVERY_MAX_PARALLEL", 10);
  if (parallel < 1) {
    throw ConfigError("DISCOVERY_MAX_PARALLEL must be at least 1, got " +
                      std::to_string(parallel));
  }
  config.max_parallel = static_cast<size_t>(parallel);

  double timeout_s = 2.0;
  if (auto raw = env("DISCOVERY_TIMEOUT_SECONDS"); raw && !raw->empty()) {
    auto parsed = util::SafeParseDouble(*raw);
    if (!parsed) {
      throw ConfigError("DISCOVERY_TIMEOUT_SECONDS must be a number, got '" +
                        *raw + "'");
    }
    timeout_s = *parsed;
  }
  if (timeout_s <= 0) {
    throw ConfigError("DISCOVERY_TIMEOUT_SECONDS must be positive, got " +
                      std::to_string(timeout_s));
  }
  config.timeout = std::chrono::milliseconds(
      std::max<int64_t>(1, std::llround(timeout_s * 1000.0)));

  int64_t port = ReadInt(env, "DISCOVERY_PORT", protocol::DEFAULT_PORT);
  if (port < 1 || port > 65535) {
    throw ConfigError("DISCOVERY_PORT must be between 1 and 65535, got " +
                      std::to_string(port));
  }
  config.port = static_cast<int>(port);

  config.Validate();
  LOG_DISC_INFO("Discovery configuration loaded: {} CIDR range(s), interval "
                "{}s, max_parallel {}, timeout {}ms, port {}",
                config.cidr_ranges.size(), config.interval.count(),
                config.max_parallel, config.timeout.count(), config.port);
  return config;
}

std::vector<StaticHost> LoadStaticHosts(const EnvLookup &env) {
  auto hosts = env("OLLAMA_HOSTS");
  if (!hosts || hosts->empty()) {
    LOG_DISC_DEBUG("OLLAMA_HOSTS environment variable not set");
    return {};
  }

  auto parsed = ParseStaticHosts(*hosts);
  LOG_DISC_INFO("Parsed {} predefined host(s)", parsed.size());
  return parsed;
}

} // namespace discovery
} // namespace llmmonitor
