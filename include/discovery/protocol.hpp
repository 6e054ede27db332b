// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_PROTOCOL_HPP
#define LLMMONITOR_DISCOVERY_PROTOCOL_HPP

#include "version.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace llmmonitor {
namespace protocol {

// Default port of an Ollama-compatible inference server
constexpr uint16_t DEFAULT_PORT = 11434;

// HTTP paths of the backend API
namespace paths {
// Lists loaded models; used as the liveness/validation endpoint
constexpr const char *PROCESS_STATUS = "/api/ps";
constexpr const char *VERSION = "/api/version";
} // namespace paths

// JSON field that must be present in a PROCESS_STATUS reply
constexpr const char *STATUS_MARKER_FIELD = "models";

// Label prefix for hosts without a resolved name ("ollama-10-0-0-2")
constexpr const char *LABEL_PREFIX = "ollama-";

// Largest range one pass will walk (an IPv4 /8); wider ranges are refused
// at configuration time
constexpr uint64_t MAX_SCAN_CANDIDATES = uint64_t{1} << 24;

// Upper bound on an HTTP reply we are willing to buffer
constexpr size_t MAX_HTTP_RESPONSE_SIZE = 4 * 1024 * 1024;

// Timeout of a backend status query (ps/version)
constexpr std::chrono::milliseconds BACKEND_QUERY_TIMEOUT{2000};

} // namespace protocol
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_PROTOCOL_HPP
