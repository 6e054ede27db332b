// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license
// Unit tests for the probe -> consumer channel and its drain barrier

#include "discovery/discovery_channel.hpp"
#include <atomic>
#include <catch2/catch.hpp>
#include <thread>

using namespace llmmonitor::discovery;
using namespace std::chrono_literals;

namespace {

DiscoveryEvent MakeEvent(const std::string &address) {
  DiscoveryEvent event;
  event.address = address;
  event.port = 11434;
  event.timestamp = 1700000000;
  return event;
}

} // namespace

TEST_CASE("DiscoveryChannel - FIFO order", "[discovery][channel][unit]") {
  DiscoveryChannel channel;
  REQUIRE(channel.Push(MakeEvent("10.0.0.1")));
  REQUIRE(channel.Push(MakeEvent("10.0.0.2")));
  CHECK(channel.Size() == 2);
  CHECK(channel.Unfinished() == 2);

  auto first = channel.Pop(10ms);
  auto second = channel.Pop(10ms);
  REQUIRE(first);
  REQUIRE(second);
  CHECK(first->address == "10.0.0.1");
  CHECK(second->address == "10.0.0.2");

  // Popped but not yet retired
  CHECK(channel.Size() == 0);
  CHECK(channel.Unfinished() == 2);

  CHECK_FALSE(channel.Pop(10ms).has_value());
}

TEST_CASE("DiscoveryChannel - Join waits for every TaskDone",
          "[discovery][channel][unit]") {
  DiscoveryChannel channel;

  SECTION("empty channel joins immediately") { CHECK(channel.Join()); }

  SECTION("join returns after the consumer retires all events") {
    for (int i = 1; i <= 5; ++i) {
      channel.Push(MakeEvent("10.0.0." + std::to_string(i)));
    }

    std::atomic<int> retired{0};
    std::thread consumer([&]() {
      while (retired.load() < 5) {
        if (channel.Pop(100ms)) {
          std::this_thread::sleep_for(2ms);
          ++retired;
          channel.TaskDone();
        }
      }
    });

    CHECK(channel.Join());
    CHECK(retired.load() == 5);
    CHECK(channel.Unfinished() == 0);
    consumer.join();
  }

  SECTION("extra TaskDone is ignored") {
    channel.TaskDone();
    CHECK(channel.Unfinished() == 0);
    CHECK(channel.Join());
  }
}

TEST_CASE("DiscoveryChannel - Close wakes waiters",
          "[discovery][channel][unit]") {
  DiscoveryChannel channel;

  SECTION("blocked Join returns false") {
    channel.Push(MakeEvent("10.0.0.1"));
    std::atomic<bool> joined{false};
    bool result = true;
    std::thread waiter([&]() {
      result = channel.Join();
      joined = true;
    });

    std::this_thread::sleep_for(20ms);
    CHECK_FALSE(joined.load());
    channel.Close();
    waiter.join();
    CHECK_FALSE(result);
  }

  SECTION("blocked Pop returns nothing well before its timeout") {
    auto start = std::chrono::steady_clock::now();
    std::thread closer([&]() {
      std::this_thread::sleep_for(20ms);
      channel.Close();
    });
    auto event = channel.Pop(5000ms);
    closer.join();
    CHECK_FALSE(event.has_value());
    CHECK(std::chrono::steady_clock::now() - start < 2000ms);
  }

  SECTION("Push is rejected once closed") {
    channel.Close();
    CHECK(channel.IsClosed());
    CHECK_FALSE(channel.Push(MakeEvent("10.0.0.1")));
    CHECK(channel.Unfinished() == 0);
    CHECK_FALSE(channel.Join());
  }
}
