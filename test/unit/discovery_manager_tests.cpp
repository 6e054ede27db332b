// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license
// Unit tests for DiscoveryManager passes, lifecycle and stats

#include "discovery/discovery_manager.hpp"
#include "../util/simulated_prober.hpp"
#include <algorithm>
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <thread>

using namespace llmmonitor::discovery;
using llmmonitor::test::SimulatedHostProber;
using namespace std::chrono_literals;

namespace {

DiscoveryConfig MakeConfig(std::vector<std::string> cidrs,
                           size_t max_parallel = 2) {
  DiscoveryConfig config;
  config.cidr_ranges = std::move(cidrs);
  config.max_parallel = max_parallel;
  config.timeout = 100ms;
  config.interval = 1s;
  return config;
}

// Poll until cond holds or the deadline passes
template <typename Cond> bool WaitUntil(Cond cond, std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!cond()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

} // namespace

TEST_CASE("DiscoveryManager - single pass over a /30",
          "[discovery][manager][unit]") {
  auto prober = std::make_shared<SimulatedHostProber>();
  prober->SetLive("10.0.0.2");

  DiscoveryManager manager(MakeConfig({"10.0.0.0/30"}, 2), {}, prober);
  REQUIRE(manager.Start(LoopMode::MANUAL));

  auto found = manager.DiscoverHosts();
  REQUIRE(found.size() == 1);
  CHECK(found[0].address == "10.0.0.2");

  auto online = manager.GetOnlineHosts();
  REQUIRE(online.size() == 1);
  CHECK(online[0].address == "10.0.0.2");
  CHECK(online[0].port == 11434);
  CHECK(online[0].is_online);
  CHECK_FALSE(online[0].is_predefined);

  CHECK(prober->ProbeCount() == 2);
  CHECK(manager.LastPeakInFlight() <= 2);
  CHECK(manager.PassesCompleted() == 1);
  CHECK(manager.GetState() == DiscoveryState::IDLE);

  manager.Stop();
}

TEST_CASE("DiscoveryManager - predefined host never answers",
          "[discovery][manager][unit]") {
  auto prober = std::make_shared<SimulatedHostProber>();
  prober->SetLive("10.0.0.1");

  DiscoveryManager manager(MakeConfig({"10.0.0.0/30"}),
                           {{"192.168.1.5", 11434}}, prober);
  REQUIRE(manager.Start(LoopMode::MANUAL));

  for (int pass = 0; pass < 3; ++pass) {
    manager.DiscoverHosts();
    auto all = manager.GetAllHosts();
    REQUIRE(all.size() == 2);
    auto it = std::find_if(all.begin(), all.end(), [](const DiscoveredHost &h) {
      return h.address == "192.168.1.5";
    });
    REQUIRE(it != all.end());
    CHECK(it->is_predefined);
    CHECK_FALSE(it->is_online);
  }
  CHECK(manager.PassesCompleted() == 3);
  manager.Stop();
}

TEST_CASE("DiscoveryManager - hosts going away and coming back",
          "[discovery][manager][unit]") {
  auto prober = std::make_shared<SimulatedHostProber>();
  prober->SetLive("10.0.0.1");
  prober->SetLive("10.0.0.2");

  DiscoveryManager manager(MakeConfig({"10.0.0.0/30"}), {}, prober);
  REQUIRE(manager.Start(LoopMode::MANUAL));

  manager.DiscoverHosts();
  CHECK(manager.GetOnlineHosts().size() == 2);

  prober->SetDead("10.0.0.1");
  auto found = manager.DiscoverHosts();
  CHECK(found.size() == 1);
  CHECK(manager.GetOnlineHosts().size() == 1);
  CHECK(manager.GetAllHosts().size() == 2);

  prober->SetLive("10.0.0.1");
  manager.DiscoverHosts();
  CHECK(manager.GetOnlineHosts().size() == 2);
  CHECK(manager.GetAllHosts().size() == 2);

  manager.Stop();
}

TEST_CASE("DiscoveryManager - stats", "[discovery][manager][unit]") {
  auto prober = std::make_shared<SimulatedHostProber>();
  prober->SetLive("10.0.0.2");

  DiscoveryManager manager(MakeConfig({"10.0.0.0/30"}),
                           {{"192.168.1.5", 11434}}, prober);

  auto before = manager.GetStats();
  CHECK(before.total_hosts == 1);
  CHECK(before.online_hosts == 0);
  CHECK(before.offline_hosts == 1);
  CHECK_FALSE(before.is_running);

  REQUIRE(manager.Start(LoopMode::MANUAL));
  manager.DiscoverHosts();

  auto stats = manager.GetStats();
  CHECK(stats.total_hosts == 2);
  CHECK(stats.online_hosts == 1);
  CHECK(stats.offline_hosts == 1);
  CHECK(stats.cidr_ranges == std::vector<std::string>{"10.0.0.0/30"});
  CHECK(stats.scan_interval == 1);
  CHECK(stats.is_running);

  auto j = manager.StatsToJson();
  CHECK(j["total_hosts"] == 2);
  CHECK(j["online_hosts"] == 1);
  CHECK(j["offline_hosts"] == 1);
  CHECK(j["is_running"] == true);
  CHECK(j["state"] == "idle");

  manager.Stop();
  CHECK_FALSE(manager.GetStats().is_running);
  CHECK(manager.StatsToJson()["state"] == "stopped");
}

TEST_CASE("DiscoveryManager - lifecycle", "[discovery][manager][unit]") {
  auto prober = std::make_shared<SimulatedHostProber>();

  SECTION("invalid configuration is rejected at construction") {
    CHECK_THROWS_AS(DiscoveryManager(MakeConfig({}), {}, prober), ConfigError);
    CHECK_THROWS_AS(DiscoveryManager(MakeConfig({"10.0.0.0/30"}, 0), {}, prober),
                    ConfigError);
  }

  SECTION("DiscoverHosts requires Start") {
    DiscoveryManager manager(MakeConfig({"10.0.0.0/30"}), {}, prober);
    CHECK_THROWS_AS(manager.DiscoverHosts(), std::runtime_error);
  }

  SECTION("double start, idempotent stop, no restart") {
    DiscoveryManager manager(MakeConfig({"10.0.0.0/30"}), {}, prober);
    REQUIRE(manager.Start(LoopMode::MANUAL));
    CHECK_FALSE(manager.Start(LoopMode::MANUAL));
    manager.Stop();
    manager.Stop();
    CHECK(manager.GetState() == DiscoveryState::STOPPED);
    CHECK_FALSE(manager.IsRunning());
    CHECK_FALSE(manager.Start(LoopMode::MANUAL));
  }

  SECTION("stop without start") {
    DiscoveryManager manager(MakeConfig({"10.0.0.0/30"}), {}, prober);
    manager.Stop();
    CHECK(manager.GetState() == DiscoveryState::STOPPED);
  }
}

TEST_CASE("DiscoveryManager - periodic loop", "[discovery][manager][unit]") {
  auto prober = std::make_shared<SimulatedHostProber>();
  prober->SetLive("10.0.0.1");

  DiscoveryManager manager(MakeConfig({"10.0.0.0/30"}), {}, prober);
  REQUIRE(manager.Start(LoopMode::PERIODIC));

  // First pass runs without waiting for the interval
  REQUIRE(WaitUntil([&] { return manager.PassesCompleted() >= 1; }, 900ms));
  CHECK(manager.GetOnlineHosts().size() == 1);

  // Stop interrupts the interval wait promptly
  auto start = std::chrono::steady_clock::now();
  manager.Stop();
  CHECK(std::chrono::steady_clock::now() - start < 900ms);
  CHECK(manager.GetState() == DiscoveryState::STOPPED);
}

TEST_CASE("DiscoveryManager - stop during a pass", "[discovery][manager][unit]") {
  // Slow probes keep the first pass busy for seconds
  auto prober = std::make_shared<SimulatedHostProber>(50ms);
  DiscoveryConfig config = MakeConfig({"10.7.0.0/24"}, 2);
  config.interval = 60s;

  DiscoveryManager manager(config, {}, prober);
  REQUIRE(manager.Start(LoopMode::PERIODIC));
  REQUIRE(WaitUntil(
      [&] { return manager.GetState() == DiscoveryState::SCANNING; }, 1000ms));

  auto start = std::chrono::steady_clock::now();
  manager.Stop();
  CHECK(std::chrono::steady_clock::now() - start < 2000ms);
  CHECK(manager.PassesCompleted() == 0);
  CHECK(prober->ProbeCount() < 254);
}
