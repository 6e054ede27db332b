// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/scanner.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <limits>

namespace llmmonitor {
namespace discovery {

BoundedScanner::BoundedScanner(HostProber &prober, size_t max_parallel,
                               std::chrono::milliseconds timeout,
                               uint16_t port)
    : prober_(prober), max_parallel_(std::max<size_t>(1, max_parallel)),
      timeout_(timeout), port_(port) {}

ScanResult BoundedScanner::Scan(const std::vector<AddressRange> &ranges,
                                DiscoveryChannel *channel) {
  auto io_context = std::make_shared<boost::asio::io_context>();
  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (cancelled_.load()) {
      throw DiscoveryCancelled("scan cancelled before start");
    }
    io_context_ = io_context;
  }

  ranges_ = &ranges;
  channel_ = channel;
  range_index_ = 0;
  offset_ = 0;
  in_flight_ = 0;
  result_ = ScanResult{};

  uint64_t total = 0;
  for (const auto &range : ranges) {
    uint64_t size = range.Size();
    total = (total > std::numeric_limits<uint64_t>::max() - size)
                ? std::numeric_limits<uint64_t>::max()
                : total + size;
    LOG_DISC_DEBUG("Scanning CIDR range {} ({} address(es))", range.ToString(),
                   size);
  }
  LOG_DISC_INFO("Scanning {} CIDR range(s), {} address(es), max_parallel={}",
                ranges.size(), total, max_parallel_);

  boost::asio::post(*io_context, [this]() { LaunchNext(); });
  io_context->run();

  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    io_context_.reset();
  }
  ranges_ = nullptr;
  channel_ = nullptr;

  if (cancelled_.load()) {
    throw DiscoveryCancelled("scan cancelled after " +
                             std::to_string(result_.probed) + " probe(s)");
  }

  LOG_DISC_INFO("Scan complete: {} host(s) found, {} address(es) probed, "
                "peak {} in flight",
                result_.found.size(), result_.probed, result_.peak_in_flight);
  return std::move(result_);
}

void BoundedScanner::Cancel() {
  cancelled_.store(true);
  std::lock_guard<std::mutex> lock(io_mutex_);
  if (io_context_) {
    io_context_->stop();
  }
}

bool BoundedScanner::NextCandidate(std::string &out) {
  while (range_index_ < ranges_->size()) {
    const AddressRange &range = (*ranges_)[range_index_];
    if (offset_ < range.Size()) {
      out = range.At(offset_++);
      return true;
    }
    ++range_index_;
    offset_ = 0;
  }
  return false;
}

void BoundedScanner::LaunchNext() {
  while (!cancelled_.load() && in_flight_ < max_parallel_) {
    std::string address;
    if (!NextCandidate(address)) {
      return;
    }

    ++in_flight_;
    result_.peak_in_flight = std::max(result_.peak_in_flight, in_flight_);

    try {
      prober_.AsyncProbe(io_context_, address, port_, timeout_,
                         [this](std::optional<DiscoveryEvent> event) {
                           OnProbeComplete(std::move(event));
                         });
    } catch (const std::exception &e) {
      LOG_DISC_WARN("Error scanning {}:{}: {}", address, port_, e.what());
      --in_flight_;
      ++result_.probed;
    }
  }
}

void BoundedScanner::OnProbeComplete(std::optional<DiscoveryEvent> event) {
  --in_flight_;
  ++result_.probed;

  if (event) {
    if (channel_ && !channel_->Push(*event)) {
      LOG_DISC_DEBUG("Discovery channel closed; {}:{} not streamed",
                     event->address, event->port);
    }
    result_.found.push_back(std::move(*event));
  }

  LaunchNext();
}

} // namespace discovery
} // namespace llmmonitor
