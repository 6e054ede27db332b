// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/host.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>

namespace llmmonitor {
namespace discovery {

std::string DiscoveredHost::Url() const {
  return "http://" + util::FormatHostForUrl(address) + ":" +
         std::to_string(port);
}

DiscoveredHost DiscoveryEvent::ToHost() const {
  DiscoveredHost host;
  host.address = address;
  host.port = port;
  host.hostname = hostname;
  host.last_seen = timestamp;
  host.is_online = is_online;
  host.is_predefined = false;
  return host;
}

void to_json(nlohmann::json &j, const DiscoveredHost &host) {
  j = nlohmann::json{{"ip", host.address},
                     {"port", host.port},
                     {"url", host.Url()},
                     {"last_seen", util::FormatISO8601(host.last_seen)},
                     {"is_online", host.is_online},
                     {"is_predefined", host.is_predefined}};
  if (host.hostname) {
    j["hostname"] = *host.hostname;
  } else {
    j["hostname"] = nullptr;
  }
}

} // namespace discovery
} // namespace llmmonitor
