// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/stream_consumer.hpp"
#include "util/logging.hpp"

namespace llmmonitor {
namespace discovery {

StreamConsumer::StreamConsumer(DiscoveryChannel &channel,
                               HostRegistry &registry)
    : channel_(channel), registry_(registry) {}

StreamConsumer::~StreamConsumer() { Stop(); }

void StreamConsumer::Start() {
  if (running_.exchange(true)) {
    LOG_DISC_WARN("StreamConsumer already running");
    return;
  }
  // A previous run that exited on its own
  if (thread_.joinable()) {
    thread_.join();
  }
  thread_ = std::thread([this]() { Run(); });
}

void StreamConsumer::Stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StreamConsumer::Run() {
  LOG_DISC_INFO("Starting discovery stream consumer");

  while (running_.load()) {
    auto event = channel_.Pop(POP_WAIT);
    if (!event) {
      if (channel_.IsClosed()) {
        break;
      }
      continue;
    }

    try {
      registry_.Merge(*event);
    } catch (const std::exception &e) {
      LOG_DISC_ERROR("Error processing discovered host {}:{}: {}",
                     event->address, event->port, e.what());
    }
    ++processed_;
    channel_.TaskDone();
  }

  running_.store(false);
  LOG_DISC_INFO("Discovery stream consumer stopped");
}

} // namespace discovery
} // namespace llmmonitor
