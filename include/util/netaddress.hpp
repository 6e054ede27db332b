// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#pragma once

/*
 Network address and string parsing utilities

 Purpose:
 - Validate and normalize IP address strings before they enter the registry
 - Parse "ip:port" pairs from configuration
 - Strict numeric parsing for configuration values (no trailing garbage)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llmmonitor {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * IPv4-mapped IPv6 addresses are normalized to IPv4 (::ffff:1.2.3.4 ->
 * 1.2.3.4) so one host never ends up under two registry keys.
 * Hostnames are rejected; only numeric addresses are accepted.
 *
 * @return Canonical address string, or std::nullopt if invalid
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string &address);

bool IsValidIPAddress(const std::string &address);

/**
 * Parse "IP:port" or "[IPv6]:port" into its components
 *
 * Unbracketed IPv6 ("::1:80") is rejected as ambiguous.
 * @return true on success; out_ip is normalized
 */
bool ParseIPPort(const std::string &address_port, std::string &out_ip,
                 uint16_t &out_port);

// Strict numeric parsing: whole string must be consumed, no whitespace
std::optional<int64_t> SafeParseInt(const std::string &str);
std::optional<double> SafeParseDouble(const std::string &str);
std::optional<uint16_t> SafeParsePort(const std::string &str);

// Split on a delimiter, trim whitespace, drop empty items
std::vector<std::string> SplitAndTrim(const std::string &str, char delim = ',');

// Render address for use inside a URL (brackets around IPv6)
std::string FormatHostForUrl(const std::string &address);

} // namespace util
} // namespace llmmonitor
