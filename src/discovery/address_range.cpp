// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/address_range.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/ip/network_v6.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace llmmonitor {
namespace discovery {

namespace {

// Adds offset to a big-endian 128-bit value in place (wraps on overflow)
void AddOffset(std::array<uint8_t, 16> &bytes, uint64_t offset) {
  unsigned carry = 0;
  for (int i = 15; i >= 0; --i) {
    unsigned add = static_cast<unsigned>(offset & 0xff);
    offset >>= 8;
    unsigned sum = bytes[i] + add + carry;
    bytes[i] = static_cast<uint8_t>(sum & 0xff);
    carry = sum >> 8;
    if (offset == 0 && carry == 0) {
      break;
    }
  }
}

} // namespace

AddressRange AddressRange::Parse(const std::string &cidr) {
  if (cidr.empty()) {
    throw std::invalid_argument("empty address range");
  }

  std::string notation = cidr;
  bool is_v6 = notation.find(':') != std::string::npos;
  if (notation.find('/') == std::string::npos) {
    notation += is_v6 ? "/128" : "/32";
  }

  AddressRange range;
  boost::system::error_code ec;

  if (!is_v6) {
    auto net = boost::asio::ip::make_network_v4(notation, ec);
    if (ec) {
      throw std::invalid_argument("invalid IPv4 range '" + cidr +
                                  "': " + ec.message());
    }
    auto canonical = net.canonical();
    auto bytes = canonical.network().to_bytes();
    range.v4_ = true;
    range.prefix_ = canonical.prefix_length();
    std::copy(bytes.begin(), bytes.end(), range.base_.begin());

    const int host_bits = 32 - range.prefix_;
    if (host_bits == 0) {
      range.first_offset_ = 0;
      range.count_ = 1;
    } else if (host_bits == 1) {
      range.first_offset_ = 0;
      range.count_ = 2;
    } else {
      range.first_offset_ = 1;
      range.count_ = (uint64_t{1} << host_bits) - 2;
    }
    return range;
  }

  auto net = boost::asio::ip::make_network_v6(notation, ec);
  if (ec) {
    throw std::invalid_argument("invalid IPv6 range '" + cidr +
                                "': " + ec.message());
  }
  auto canonical = net.canonical();
  range.v4_ = false;
  range.prefix_ = canonical.prefix_length();
  range.base_ = canonical.network().to_bytes();

  const int host_bits = 128 - range.prefix_;
  if (host_bits == 0) {
    range.first_offset_ = 0;
    range.count_ = 1;
  } else if (host_bits == 1) {
    range.first_offset_ = 0;
    range.count_ = 2;
  } else if (host_bits >= 64) {
    range.first_offset_ = 1;
    range.count_ = std::numeric_limits<uint64_t>::max();
  } else {
    // Every address except the Subnet-Router anycast (network) address
    range.first_offset_ = 1;
    range.count_ = (uint64_t{1} << host_bits) - 1;
  }
  return range;
}

std::optional<AddressRange> AddressRange::TryParse(const std::string &cidr) {
  try {
    return Parse(cidr);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  }
}

std::string AddressRange::BaseAddress() const {
  if (v4_) {
    boost::asio::ip::address_v4::bytes_type bytes;
    std::copy(base_.begin(), base_.begin() + 4, bytes.begin());
    return boost::asio::ip::address_v4(bytes).to_string();
  }
  return boost::asio::ip::address_v6(base_).to_string();
}

std::string AddressRange::ToString() const {
  return BaseAddress() + "/" + std::to_string(prefix_);
}

std::string AddressRange::At(uint64_t index) const {
  if (index >= count_) {
    throw std::out_of_range("address index " + std::to_string(index) +
                            " outside range " + ToString());
  }

  if (v4_) {
    uint32_t base = (uint32_t{base_[0]} << 24) | (uint32_t{base_[1]} << 16) |
                    (uint32_t{base_[2]} << 8) | uint32_t{base_[3]};
    uint32_t value = base + static_cast<uint32_t>(first_offset_ + index);
    return boost::asio::ip::address_v4(value).to_string();
  }

  auto bytes = base_;
  AddOffset(bytes, first_offset_);
  AddOffset(bytes, index);
  return boost::asio::ip::address_v6(bytes).to_string();
}

std::vector<std::string> AddressRange::Expand(uint64_t max_items) const {
  if (count_ > max_items) {
    throw std::length_error("range " + ToString() + " has " +
                            std::to_string(count_) +
                            " candidates, above expansion limit");
  }

  std::vector<std::string> out;
  out.reserve(static_cast<size_t>(count_));
  for (uint64_t i = 0; i < count_; ++i) {
    out.push_back(At(i));
  }
  return out;
}

} // namespace discovery
} // namespace llmmonitor
