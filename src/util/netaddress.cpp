// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include <boost/asio/ip/address.hpp>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace llmmonitor {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string &address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped,
                                                 ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();
  } catch (const std::exception &e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}",
              address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string &address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool ParseIPPort(const std::string &address_port, std::string &out_ip,
                 uint16_t &out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip_part;
  std::string port_part;

  if (address_port[0] == '[') {
    size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= address_port.size() ||
        address_port[bracket_end + 1] != ':') {
      return false;
    }
    ip_part = address_port.substr(1, bracket_end - 1);
    port_part = address_port.substr(bracket_end + 2);
  } else {
    size_t first_colon = address_port.find(':');
    if (first_colon == std::string::npos) {
      return false;
    }
    // More than one colon means an unbracketed IPv6 address
    if (address_port.find(':', first_colon + 1) != std::string::npos) {
      return false;
    }
    ip_part = address_port.substr(0, first_colon);
    port_part = address_port.substr(first_colon + 1);
  }

  auto port = SafeParsePort(port_part);
  if (!port) {
    return false;
  }

  auto normalized = ValidateAndNormalizeIP(ip_part);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

std::optional<int64_t> SafeParseInt(const std::string &str) {
  if (str.empty()) {
    return std::nullopt;
  }

  int64_t value = 0;
  const char *begin = str.data();
  const char *end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> SafeParseDouble(const std::string &str) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str.front()))) {
    return std::nullopt;
  }

  char *end = nullptr;
  errno = 0;
  double value = std::strtod(str.c_str(), &end);
  if (errno != 0 || end != str.c_str() + str.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = SafeParseInt(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::vector<std::string> SplitAndTrim(const std::string &str, char delim) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(delim, pos);
    if (next == std::string::npos) {
      next = str.size();
    }

    size_t first = pos;
    size_t last = next;
    while (first < last && std::isspace(static_cast<unsigned char>(str[first]))) {
      ++first;
    }
    while (last > first &&
           std::isspace(static_cast<unsigned char>(str[last - 1]))) {
      --last;
    }
    if (last > first) {
      out.push_back(str.substr(first, last - first));
    }
    pos = next + 1;
  }
  return out;
}

std::string FormatHostForUrl(const std::string &address) {
  if (address.find(':') != std::string::npos) {
    return "[" + address + "]";
  }
  return address;
}

} // namespace util
} // namespace llmmonitor
