// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license
// Unit tests for AdaptivePollController tick/cycle accounting

#include "polling/adaptive_poll_controller.hpp"
#include <atomic>
#include <catch2/catch.hpp>
#include <stdexcept>
#include <thread>

using namespace llmmonitor::polling;
using namespace std::chrono_literals;

namespace {

PollConfig MakeConfig(size_t threshold, size_t max_cycles) {
  PollConfig config;
  config.window = 1s;
  config.tick_threshold = threshold;
  config.max_cycles = max_cycles;
  return config;
}

} // namespace

TEST_CASE("AdaptivePollController - tick threshold",
          "[polling][controller][unit]") {
  AdaptivePollController controller(MakeConfig(4, 12));
  int refreshes = 0;
  REQUIRE(controller.Start([&]() { ++refreshes; }, false));

  SECTION("threshold ticks refresh once and reset both counters") {
    controller.Tick();
    controller.Tick();
    controller.OnWindowElapsed();
    // window boundary restarts the tick count
    CHECK(controller.TickCount() == 0);
    CHECK(controller.CycleCount() == 1);

    for (int i = 0; i < 3; ++i) {
      controller.Tick();
    }
    CHECK(refreshes == 0);
    controller.Tick();

    CHECK(refreshes == 1);
    CHECK(controller.RefreshCount() == 1);
    CHECK(controller.TickCount() == 0);
    CHECK(controller.CycleCount() == 0);
  }

  SECTION("ticks spread over windows never add up") {
    for (int window = 0; window < 5; ++window) {
      controller.Tick();
      controller.Tick();
      controller.Tick();
      controller.OnWindowElapsed();
    }
    CHECK(refreshes == 0);
    CHECK(controller.CycleCount() == 5);
  }

  controller.Stop();
}

TEST_CASE("AdaptivePollController - forced refresh after max cycles",
          "[polling][controller][unit]") {
  const size_t threshold = 4;
  const size_t max_cycles = 3;
  AdaptivePollController controller(MakeConfig(threshold, max_cycles));
  int refreshes = 0;
  REQUIRE(controller.Start([&]() { ++refreshes; }, false));

  SECTION("busy but below threshold in every window") {
    for (size_t window = 1; window <= max_cycles; ++window) {
      for (size_t i = 0; i < threshold - 1; ++i) {
        controller.Tick();
      }
      controller.OnWindowElapsed();
      CHECK(refreshes == (window == max_cycles ? 1 : 0));
    }
    CHECK(controller.TickCount() == 0);
    CHECK(controller.CycleCount() == 0);
  }

  SECTION("completely idle") {
    controller.OnWindowElapsed();
    controller.OnWindowElapsed();
    CHECK(refreshes == 0);
    controller.OnWindowElapsed();
    CHECK(refreshes == 1);

    // The cycle count starts over after a forced refresh
    controller.OnWindowElapsed();
    controller.OnWindowElapsed();
    CHECK(refreshes == 1);
    controller.OnWindowElapsed();
    CHECK(refreshes == 2);
  }

  SECTION("a tick-driven refresh restarts the cycle count") {
    controller.OnWindowElapsed();
    controller.OnWindowElapsed();
    for (size_t i = 0; i < threshold; ++i) {
      controller.Tick();
    }
    CHECK(refreshes == 1);
    controller.OnWindowElapsed();
    controller.OnWindowElapsed();
    CHECK(refreshes == 1);
  }

  controller.Stop();
}

TEST_CASE("AdaptivePollController - callback failure",
          "[polling][controller][unit]") {
  AdaptivePollController controller(MakeConfig(2, 12));
  int calls = 0;
  REQUIRE(controller.Start(
      [&]() {
        ++calls;
        throw std::runtime_error("backend unreachable");
      },
      false));

  controller.Tick();
  REQUIRE_NOTHROW(controller.Tick());
  CHECK(calls == 1);
  CHECK(controller.RefreshCount() == 1);
  CHECK(controller.TickCount() == 0);

  // Still operational afterwards
  controller.Tick();
  controller.Tick();
  CHECK(calls == 2);
  controller.Stop();
}

TEST_CASE("AdaptivePollController - lifecycle", "[polling][controller][unit]") {
  SECTION("invalid configuration") {
    CHECK_THROWS_AS(AdaptivePollController(MakeConfig(0, 12)),
                    std::invalid_argument);
    CHECK_THROWS_AS(AdaptivePollController(MakeConfig(4, 0)),
                    std::invalid_argument);
    PollConfig zero_window = MakeConfig(4, 12);
    zero_window.window = 0s;
    CHECK_THROWS_AS(AdaptivePollController(zero_window), std::invalid_argument);
  }

  SECTION("ticks before start and after stop are ignored") {
    AdaptivePollController controller(MakeConfig(1, 12));
    int refreshes = 0;
    controller.Tick();
    CHECK(controller.TickCount() == 0);

    REQUIRE(controller.Start([&]() { ++refreshes; }, false));
    CHECK(controller.IsRunning());
    CHECK_FALSE(controller.Start([&]() { ++refreshes; }, false));

    controller.Stop();
    controller.Stop();
    CHECK_FALSE(controller.IsRunning());
    controller.Tick();
    controller.OnWindowElapsed();
    CHECK(refreshes == 0);
    CHECK(controller.CycleCount() == 0);
    CHECK_FALSE(controller.Start([&]() { ++refreshes; }, false));
  }

  SECTION("window timer drives the forced refresh") {
    AdaptivePollController controller(MakeConfig(100, 1));
    std::atomic<int> refreshes{0};
    REQUIRE(controller.Start([&]() { ++refreshes; }));

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (refreshes.load() == 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(20ms);
    }
    CHECK(refreshes.load() >= 1);

    auto start = std::chrono::steady_clock::now();
    controller.Stop();
    CHECK(std::chrono::steady_clock::now() - start < 1s);
  }
}
