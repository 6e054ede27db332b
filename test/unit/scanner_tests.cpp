// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license
// Unit tests for BoundedScanner (concurrency cap, outcomes, cancellation)

#include "discovery/scanner.hpp"
#include "../util/simulated_prober.hpp"
#include <algorithm>
#include <catch2/catch.hpp>
#include <set>
#include <thread>

using namespace llmmonitor::discovery;
using llmmonitor::test::SimulatedHostProber;
using namespace std::chrono_literals;

namespace {

std::vector<AddressRange> Ranges(std::initializer_list<const char *> cidrs) {
  std::vector<AddressRange> out;
  for (const char *cidr : cidrs) {
    out.push_back(AddressRange::Parse(cidr));
  }
  return out;
}

} // namespace

TEST_CASE("BoundedScanner - one live host in a /30",
          "[discovery][scanner][unit]") {
  SimulatedHostProber prober;
  prober.SetLive("10.0.0.2", "gpu-box");

  BoundedScanner scanner(prober, 2, 1500ms, 11434);
  auto result = scanner.Scan(Ranges({"10.0.0.0/30"}));

  CHECK(result.probed == 2);
  REQUIRE(result.found.size() == 1);
  CHECK(result.found[0].address == "10.0.0.2");
  CHECK(result.found[0].port == 11434);
  CHECK(result.found[0].hostname == std::string("gpu-box"));
  CHECK(prober.LastTimeout() == 1500ms);

  auto probed = prober.Probed();
  std::sort(probed.begin(), probed.end());
  CHECK(probed == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
}

TEST_CASE("BoundedScanner - global concurrency cap",
          "[discovery][scanner][unit]") {
  SimulatedHostProber prober(2ms);
  prober.SetLive("10.0.1.10");
  prober.SetLive("10.0.2.20");

  SECTION("cap shared across ranges") {
    BoundedScanner scanner(prober, 4, 100ms, 11434);
    auto result = scanner.Scan(Ranges({"10.0.1.0/26", "10.0.2.0/26"}));

    CHECK(result.probed == 124);
    CHECK(prober.ProbeCount() == 124);
    CHECK(result.found.size() == 2);
    CHECK(result.peak_in_flight == 4);
    CHECK(prober.PeakInFlight() <= 4);

    auto probed = prober.Probed();
    std::set<std::string> unique(probed.begin(), probed.end());
    CHECK(unique.size() == probed.size());
  }

  SECTION("cap of one is strictly sequential") {
    BoundedScanner scanner(prober, 1, 100ms, 11434);
    auto result = scanner.Scan(Ranges({"10.0.1.8/29"}));
    CHECK(result.probed == 6);
    CHECK(result.found.size() == 1);
    CHECK(result.peak_in_flight == 1);
    CHECK(prober.PeakInFlight() == 1);
  }

  SECTION("cap larger than the candidate count") {
    BoundedScanner scanner(prober, 50, 100ms, 11434);
    auto result = scanner.Scan(Ranges({"10.0.1.8/30"}));
    CHECK(result.probed == 2);
    CHECK(result.peak_in_flight == 2);
  }
}

TEST_CASE("BoundedScanner - outcomes stream to the channel",
          "[discovery][scanner][unit]") {
  SimulatedHostProber prober;
  prober.SetLive("10.0.0.1");
  prober.SetLive("10.0.0.6");

  DiscoveryChannel channel;
  BoundedScanner scanner(prober, 3, 100ms, 8080);
  auto result = scanner.Scan(Ranges({"10.0.0.0/29"}), &channel);

  CHECK(result.found.size() == 2);
  CHECK(channel.Size() == 2);
  std::set<std::string> streamed;
  while (auto event = channel.Pop(10ms)) {
    CHECK(event->port == 8080);
    streamed.insert(event->address);
    channel.TaskDone();
  }
  CHECK(streamed == std::set<std::string>{"10.0.0.1", "10.0.0.6"});
}

TEST_CASE("BoundedScanner - a throwing probe does not abort the pass",
          "[discovery][scanner][unit]") {
  SimulatedHostProber prober;
  prober.SetThrows("10.0.0.1");
  prober.SetLive("10.0.0.2");

  BoundedScanner scanner(prober, 2, 100ms, 11434);
  auto result = scanner.Scan(Ranges({"10.0.0.0/30"}));

  CHECK(result.probed == 2);
  REQUIRE(result.found.size() == 1);
  CHECK(result.found[0].address == "10.0.0.2");
}

TEST_CASE("BoundedScanner - empty range list", "[discovery][scanner][unit]") {
  SimulatedHostProber prober;
  BoundedScanner scanner(prober, 4, 100ms, 11434);
  auto result = scanner.Scan({});
  CHECK(result.probed == 0);
  CHECK(result.found.empty());
  CHECK(prober.ProbeCount() == 0);
}

TEST_CASE("BoundedScanner - cancellation", "[discovery][scanner][unit]") {
  SECTION("cancel before Scan") {
    SimulatedHostProber prober;
    BoundedScanner scanner(prober, 4, 100ms, 11434);
    scanner.Cancel();
    CHECK(scanner.IsCancelled());
    CHECK_THROWS_AS(scanner.Scan(Ranges({"10.0.0.0/30"})), DiscoveryCancelled);
    CHECK(prober.ProbeCount() == 0);
  }

  SECTION("cancel mid-pass from another thread") {
    SimulatedHostProber prober(20ms);
    BoundedScanner scanner(prober, 2, 100ms, 11434);

    std::thread canceller([&]() {
      std::this_thread::sleep_for(50ms);
      scanner.Cancel();
    });

    // 254 candidates at 2 per 20ms would take over two seconds
    auto start = std::chrono::steady_clock::now();
    CHECK_THROWS_AS(scanner.Scan(Ranges({"10.9.0.0/24"})), DiscoveryCancelled);
    canceller.join();

    CHECK(std::chrono::steady_clock::now() - start < 1500ms);
    CHECK(prober.ProbeCount() < 254);
  }
}
