// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/backend.hpp"
#include "discovery/http_client.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace llmmonitor {
namespace discovery {

void to_json(nlohmann::json &j, const ModelDetails &d) {
  j = nlohmann::json{{"parent_model", d.parent_model},
                     {"format", d.format},
                     {"family", d.family},
                     {"families", d.families},
                     {"parameter_size", d.parameter_size},
                     {"quantization_level", d.quantization_level}};
}

void from_json(const nlohmann::json &j, ModelDetails &d) {
  d.parent_model = j.value("parent_model", "");
  d.format = j.value("format", "");
  d.family = j.value("family", "");
  if (j.contains("families") && j["families"].is_array()) {
    d.families = j["families"].get<std::vector<std::string>>();
  } else {
    d.families.clear();
  }
  d.parameter_size = j.value("parameter_size", "");
  d.quantization_level = j.value("quantization_level", "");
}

void to_json(nlohmann::json &j, const Model &m) {
  j = nlohmann::json{{"name", m.name},
                     {"model", m.model},
                     {"size", m.size},
                     {"digest", m.digest},
                     {"details", m.details},
                     {"expires_at", m.expires_at},
                     {"size_vram", m.size_vram}};
}

void from_json(const nlohmann::json &j, Model &m) {
  m.name = j.value("name", "");
  m.model = j.value("model", "");
  m.size = j.value("size", int64_t{0});
  m.digest = j.value("digest", "");
  if (j.contains("details") && j["details"].is_object()) {
    m.details = j["details"].get<ModelDetails>();
  } else {
    m.details = ModelDetails{};
  }
  m.expires_at = j.value("expires_at", "");
  m.size_vram = j.value("size_vram", int64_t{0});
}

void to_json(nlohmann::json &j, const ProcessStatus &s) {
  j = nlohmann::json{{"models", s.models},
                     {"is_online", s.is_online},
                     {"ip", s.address},
                     {"port", s.port}};
  if (s.version) {
    j["version"] = *s.version;
  } else {
    j["version"] = nullptr;
  }
}

std::string MakeBackendLabel(const DiscoveredHost &host) {
  if (host.hostname && !host.hostname->empty()) {
    return *host.hostname;
  }
  std::string suffix = host.address;
  std::replace(suffix.begin(), suffix.end(), '.', '-');
  std::replace(suffix.begin(), suffix.end(), ':', '-');
  return std::string(protocol::LABEL_PREFIX) + suffix;
}

// ============================================================================
// OllamaBackend
// ============================================================================

OllamaBackend::OllamaBackend(const DiscoveredHost &host,
                             std::chrono::milliseconds timeout)
    : Backend(MakeBackendLabel(host), host.address, host.port),
      timeout_(timeout) {}

std::optional<std::string> OllamaBackend::QueryVersion() const {
  std::string error;
  auto response =
      HttpGet(Address(), Port(), protocol::paths::VERSION, timeout_, &error);
  if (!response) {
    LOG_DEBUG("Error getting version from {}:{}: {}", Address(), Port(), error);
    return std::nullopt;
  }
  if (response->status != 200) {
    LOG_DEBUG("HTTP {} getting version from {}:{}", response->status, Address(),
              Port());
    return std::nullopt;
  }

  auto data = nlohmann::json::parse(response->body, nullptr, false);
  if (data.is_discarded() || !data.is_object() || !data.contains("version") ||
      !data["version"].is_string()) {
    LOG_DEBUG("Malformed version reply from {}:{}", Address(), Port());
    return std::nullopt;
  }
  return data["version"].get<std::string>();
}

ProcessStatus OllamaBackend::Probe() const {
  LOG_DEBUG("Querying backend {} at {}:{}", Label(), Address(), Port());

  std::string error;
  auto response = HttpGet(Address(), Port(), protocol::paths::PROCESS_STATUS,
                          timeout_, &error);
  if (!response) {
    LOG_WARN("Connection error to backend at {}:{}: {}", Address(), Port(),
             error);
    return ProcessStatus::Offline(Address(), Port());
  }
  if (response->status != 200) {
    LOG_ERROR("HTTP error {} from backend at {}:{}", response->status,
              Address(), Port());
    return ProcessStatus::Offline(Address(), Port());
  }

  ProcessStatus status;
  status.address = Address();
  status.port = Port();
  try {
    auto data = nlohmann::json::parse(response->body);
    if (data.contains(protocol::STATUS_MARKER_FIELD)) {
      status.models =
          data[protocol::STATUS_MARKER_FIELD].get<std::vector<Model>>();
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("Unexpected reply from backend at {}:{}: {}", Address(), Port(),
              e.what());
    return ProcessStatus::Offline(Address(), Port());
  }

  status.is_online = true;
  status.version = QueryVersion();
  LOG_INFO("Backend at {}:{}: {} model(s) running, version: {}", Address(),
           Port(), status.models.size(), status.version.value_or("unknown"));
  return status;
}

std::shared_ptr<Backend> MakeBackend(BackendType type,
                                     const DiscoveredHost &host) {
  switch (type) {
  case BackendType::OLLAMA:
    return std::make_shared<OllamaBackend>(host);
  }
  throw std::invalid_argument("unknown backend type");
}

} // namespace discovery
} // namespace llmmonitor
