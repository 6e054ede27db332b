// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#pragma once

#include "discovery/protocol.hpp"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace llmmonitor {
namespace discovery {

/**
 * DiscoveredHost - registry record for one inference host
 *
 * Keyed by address in the registry; port takes part only in duplicate
 * detection. is_predefined is fixed at creation.
 */
struct DiscoveredHost {
  std::string address;
  uint16_t port{protocol::DEFAULT_PORT};
  std::optional<std::string> hostname;
  int64_t last_seen{0}; // unix seconds
  bool is_online{false};
  bool is_predefined{false};

  // "http://10.0.0.2:11434", IPv6 bracketed
  std::string Url() const;

  bool SameEndpoint(const std::string &other_address,
                    uint16_t other_port) const {
    return address == other_address && port == other_port;
  }
};

/**
 * DiscoveryEvent - one positive probe outcome, streamed to the consumer
 * and merged into the registry exactly once
 */
struct DiscoveryEvent {
  std::string address;
  uint16_t port{protocol::DEFAULT_PORT};
  std::optional<std::string> hostname;
  int64_t timestamp{0};
  bool is_online{true};

  DiscoveredHost ToHost() const;
};

// Statically configured host ("ip:port" from configuration)
struct StaticHost {
  std::string address;
  uint16_t port{protocol::DEFAULT_PORT};

  bool operator==(const StaticHost &other) const = default;
};

void to_json(nlohmann::json &j, const DiscoveredHost &host);

} // namespace discovery
} // namespace llmmonitor
