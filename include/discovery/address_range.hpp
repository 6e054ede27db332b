// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_ADDRESS_RANGE_HPP
#define LLMMONITOR_DISCOVERY_ADDRESS_RANGE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llmmonitor {
namespace discovery {

/**
 * AddressRange - one CIDR block expanded into its probe candidates
 *
 * Host bits in the input are masked off ("10.0.0.5/30" -> "10.0.0.4/30").
 * A bare address is treated as a single-host range (/32 or /128).
 *
 * Candidates ("usable hosts"):
 *   IPv4 /0../30   network+1 .. broadcast-1
 *   IPv4 /31       both addresses
 *   IPv4 /32       the base address
 *   IPv6 /0../126  network+1 .. last address
 *   IPv6 /127      both addresses
 *   IPv6 /128      the base address
 *
 * Candidates are computed on demand (At), so a large range never has to be
 * materialized.
 */
class AddressRange {
public:
  // Throws std::invalid_argument with a descriptive message
  static AddressRange Parse(const std::string &cidr);
  static std::optional<AddressRange> TryParse(const std::string &cidr);

  bool is_v4() const { return v4_; }
  int prefix_length() const { return prefix_; }

  // Canonical notation, e.g. "192.168.1.0/24"
  std::string ToString() const;

  // Network (base) address without prefix
  std::string BaseAddress() const;

  // Number of candidates; saturates at UINT64_MAX for huge IPv6 ranges
  uint64_t Size() const { return count_; }

  // index-th candidate, 0 <= index < Size(); throws std::out_of_range
  std::string At(uint64_t index) const;

  // Materialize every candidate; throws std::length_error above max_items
  std::vector<std::string> Expand(uint64_t max_items = kMaxExpand) const;

  static constexpr uint64_t kMaxExpand = 1u << 24;

private:
  AddressRange() = default;

  bool v4_{true};
  int prefix_{32};
  std::array<uint8_t, 16> base_{}; // IPv4 uses the first four bytes
  uint64_t first_offset_{0};
  uint64_t count_{1};
};

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_ADDRESS_RANGE_HPP
