// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_BACKEND_HPP
#define LLMMONITOR_DISCOVERY_BACKEND_HPP

#include "discovery/host.hpp"
#include "discovery/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace llmmonitor {
namespace discovery {

// Wire types of the backend's /api/ps reply
struct ModelDetails {
  std::string parent_model;
  std::string format;
  std::string family;
  std::vector<std::string> families;
  std::string parameter_size;
  std::string quantization_level;
};

struct Model {
  std::string name;
  std::string model;
  int64_t size{0};
  std::string digest;
  ModelDetails details;
  std::string expires_at;
  int64_t size_vram{0};
};

struct ProcessStatus {
  std::vector<Model> models;
  bool is_online{false};
  std::optional<std::string> version;
  std::string address;
  uint16_t port{protocol::DEFAULT_PORT};

  static ProcessStatus Offline(const std::string &address, uint16_t port) {
    ProcessStatus status;
    status.address = address;
    status.port = port;
    return status;
  }
};

void to_json(nlohmann::json &j, const ModelDetails &d);
void from_json(const nlohmann::json &j, ModelDetails &d);
void to_json(nlohmann::json &j, const Model &m);
void from_json(const nlohmann::json &j, Model &m);
void to_json(nlohmann::json &j, const ProcessStatus &s);

enum class BackendType { OLLAMA };

/**
 * Backend - capability interface of one inference host
 *
 * Probe() never throws for network conditions; an unreachable or
 * misbehaving host yields an offline ProcessStatus.
 */
class Backend {
public:
  virtual ~Backend() = default;

  virtual BackendType Type() const = 0;
  virtual ProcessStatus Probe() const = 0;

  const std::string &Label() const { return label_; }
  const std::string &Address() const { return address_; }
  uint16_t Port() const { return port_; }

protected:
  Backend(std::string label, std::string address, uint16_t port)
      : label_(std::move(label)), address_(std::move(address)), port_(port) {}

private:
  std::string label_;
  std::string address_;
  uint16_t port_;
};

// Ollama-compatible server: GET /api/ps, then GET /api/version
class OllamaBackend : public Backend {
public:
  OllamaBackend(const DiscoveredHost &host,
                std::chrono::milliseconds timeout = protocol::BACKEND_QUERY_TIMEOUT);

  BackendType Type() const override { return BackendType::OLLAMA; }
  ProcessStatus Probe() const override;

  std::optional<std::string> QueryVersion() const;

private:
  std::chrono::milliseconds timeout_;
};

// Resolved name if any, else "ollama-10-0-0-2" ('.' and ':' become '-')
std::string MakeBackendLabel(const DiscoveredHost &host);

std::shared_ptr<Backend> MakeBackend(BackendType type,
                                     const DiscoveredHost &host);

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_BACKEND_HPP
