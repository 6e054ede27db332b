// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license
// Unit tests for CIDR expansion into probe candidates

#include "discovery/address_range.hpp"
#include <catch2/catch.hpp>
#include <limits>
#include <set>
#include <stdexcept>

using namespace llmmonitor::discovery;

TEST_CASE("AddressRange - IPv4 usable hosts", "[discovery][range][unit]") {
  SECTION("/30 yields the two inner addresses") {
    auto range = AddressRange::Parse("10.0.0.0/30");
    REQUIRE(range.is_v4());
    REQUIRE(range.Size() == 2);
    auto hosts = range.Expand();
    REQUIRE(hosts == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
  }

  SECTION("/24 excludes network and broadcast") {
    auto range = AddressRange::Parse("192.168.1.0/24");
    REQUIRE(range.Size() == 254);
    CHECK(range.At(0) == "192.168.1.1");
    CHECK(range.At(253) == "192.168.1.254");
  }

  SECTION("/31 yields both addresses") {
    auto hosts = AddressRange::Parse("10.1.1.0/31").Expand();
    REQUIRE(hosts == std::vector<std::string>{"10.1.1.0", "10.1.1.1"});
  }

  SECTION("/32 yields the base address itself") {
    auto hosts = AddressRange::Parse("10.1.1.7/32").Expand();
    REQUIRE(hosts == std::vector<std::string>{"10.1.1.7"});
  }

  SECTION("bare address is a single host") {
    auto range = AddressRange::Parse("172.16.0.9");
    CHECK(range.prefix_length() == 32);
    CHECK(range.Expand() == std::vector<std::string>{"172.16.0.9"});
  }

  SECTION("host bits are masked off") {
    auto range = AddressRange::Parse("10.0.0.5/30");
    CHECK(range.ToString() == "10.0.0.4/30");
    CHECK(range.Expand() == std::vector<std::string>{"10.0.0.5", "10.0.0.6"});
  }
}

TEST_CASE("AddressRange - every candidate exactly once",
          "[discovery][range][unit]") {
  auto range = AddressRange::Parse("10.20.0.0/22");
  auto hosts = range.Expand();
  std::set<std::string> unique(hosts.begin(), hosts.end());

  REQUIRE(hosts.size() == 1022);
  REQUIRE(unique.size() == hosts.size());
  CHECK(unique.count("10.20.0.0") == 0);
  CHECK(unique.count("10.20.3.255") == 0);
  CHECK(unique.count("10.20.1.0") == 1);
  CHECK(unique.count("10.20.2.255") == 1);
}

TEST_CASE("AddressRange - IPv6", "[discovery][range][unit]") {
  SECTION("/126 skips only the network address") {
    auto hosts = AddressRange::Parse("fd00::/126").Expand();
    REQUIRE(hosts == std::vector<std::string>{"fd00::1", "fd00::2", "fd00::3"});
  }

  SECTION("/127 yields both addresses") {
    auto hosts = AddressRange::Parse("fd00::4/127").Expand();
    REQUIRE(hosts == std::vector<std::string>{"fd00::4", "fd00::5"});
  }

  SECTION("/128 yields the base address") {
    auto range = AddressRange::Parse("::1");
    CHECK_FALSE(range.is_v4());
    CHECK(range.Expand() == std::vector<std::string>{"::1"});
  }

  SECTION("huge ranges saturate and are not materialized") {
    auto range = AddressRange::Parse("fd00::/48");
    CHECK(range.Size() == std::numeric_limits<uint64_t>::max());
    CHECK(range.At(0) == "fd00::1");
    CHECK(range.At(0xffff) == "fd00::1:0");
    CHECK_THROWS_AS(range.Expand(), std::length_error);
  }
}

TEST_CASE("AddressRange - invalid input", "[discovery][range][unit]") {
  CHECK_THROWS_AS(AddressRange::Parse(""), std::invalid_argument);
  CHECK_THROWS_AS(AddressRange::Parse("not-a-cidr"), std::invalid_argument);
  CHECK_THROWS_AS(AddressRange::Parse("10.0.0.0/33"), std::invalid_argument);
  CHECK_THROWS_AS(AddressRange::Parse("300.1.1.1/24"), std::invalid_argument);
  CHECK_THROWS_AS(AddressRange::Parse("fd00::/129"), std::invalid_argument);
  CHECK_FALSE(AddressRange::TryParse("10.0.0/24").has_value());

  auto range = AddressRange::Parse("10.0.0.0/30");
  CHECK_THROWS_AS(range.At(2), std::out_of_range);
}
