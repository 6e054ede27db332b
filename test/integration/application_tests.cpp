// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license
// Application wiring: one-shot run and daemon lifecycle

#include "application.hpp"
#include "../util/loopback_http_server.hpp"
#include "../util/simulated_prober.hpp"
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

using namespace llmmonitor;
using llmmonitor::test::LoopbackHttpServer;
using llmmonitor::test::SimulatedHostProber;
using namespace std::chrono_literals;

TEST_CASE("Application - one-shot run", "[app][integration]") {
  LoopbackHttpServer server;
  server.SetJsonReply("/api/ps", 200, R"({"models":[]})");
  server.SetJsonReply("/api/version", 200, R"({"version":"0.1.32"})");

  app::AppConfig config;
  config.run_once = true;
  config.discovery.cidr_ranges = {"127.0.0.1/32"};
  config.discovery.port = server.Port();
  config.discovery.timeout = 1000ms;
  config.static_hosts = {{"127.0.0.2", 11434}};

  app::Application application(
      config, std::make_shared<discovery::HttpHostProbe>(1, false));
  REQUIRE(application.initialize());

  auto out = application.run_once();
  REQUIRE(out["hosts"].size() == 2);
  CHECK(out["stats"]["online_hosts"] == 1);
  CHECK(out["stats"]["total_hosts"] == 2);

  const auto &endpoints = out["endpoints"];
  REQUIRE(endpoints.contains("ollama-127-0-0-1"));
  CHECK(endpoints["ollama-127-0-0-1"]["is_online"] == true);
  CHECK(endpoints["ollama-127-0-0-1"]["version"] == "0.1.32");
  CHECK(endpoints.contains("ollama-127-0-0-2"));
}

TEST_CASE("Application - invalid configuration", "[app][integration]") {
  app::AppConfig config;
  config.discovery.cidr_ranges = {"10.0.0.0/30"};
  config.discovery.max_parallel = 0;

  app::Application application(config,
                                std::make_shared<SimulatedHostProber>());
  CHECK_FALSE(application.initialize());
  CHECK_FALSE(application.start());
}

TEST_CASE("Application - daemon lifecycle", "[app][integration]") {
  auto prober = std::make_shared<SimulatedHostProber>();

  app::AppConfig config;
  config.discovery.cidr_ranges = {"10.0.0.0/30"};
  config.discovery.interval = 60s;
  config.poll.tick_threshold = 2;

  app::Application application(config, prober);
  REQUIRE(application.initialize());
  REQUIRE(application.start());
  CHECK(app::Application::instance() == &application);
  CHECK_FALSE(application.start());

  // Two ticks reach the threshold and refresh the (empty) endpoint cache
  application.tick();
  application.tick();
  CHECK(application.poll_controller().RefreshCount() == 1);
  CHECK(application.endpoints_cache().LastUpdated() > 0);

  auto health = application.health();
  CHECK(health["status"] == "healthy");
  CHECK(health["discovery"]["is_running"] == true);
  CHECK(health["endpoints_cached"] == 0);

  application.request_shutdown();
  application.wait_for_shutdown();
  CHECK(application.health()["status"] == "stopped");
  CHECK_FALSE(application.discovery_manager().IsRunning());
}
