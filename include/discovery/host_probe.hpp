// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_HOST_PROBE_HPP
#define LLMMONITOR_DISCOVERY_HOST_PROBE_HPP

#include "discovery/host.hpp"
#include "util/threadpool.hpp"
#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace llmmonitor {
namespace discovery {

// Called once per probe with the confirmed host, or std::nullopt if absent
using ProbeCallback = std::function<void(std::optional<DiscoveryEvent>)>;

// Blocking address -> name lookup, run on the resolver pool
using NameResolver =
    std::function<std::optional<std::string>(const std::string &address)>;

/**
 * HostProber - abstract probe of one candidate address
 *
 * Implementations:
 * - HttpHostProbe: real TCP + HTTP check (production)
 * - SimulatedHostProber (test/): scripted outcomes for scanner tests
 *
 * Contract:
 * - callback is invoked exactly once, from the io_context thread, never
 *   synchronously from inside AsyncProbe()
 * - failures are reported as absent, never thrown
 */
class HostProber {
public:
  virtual ~HostProber() = default;

  virtual void AsyncProbe(std::shared_ptr<boost::asio::io_context> io_context,
                          const std::string &address, uint16_t port,
                          std::chrono::milliseconds timeout,
                          ProbeCallback callback) = 0;
};

/**
 * HttpHostProbe - two-stage fail-fast probe
 *
 * 1. TCP connect within timeout; closed right away
 * 2. GET /api/ps within timeout; needs status 200 and a JSON object that
 *    carries the "models" key
 * 3. reverse DNS on the resolver pool within timeout; failure only drops
 *    the name
 *
 * The lookup task holds no reference to the pass: a lookup that outlives
 * the timeout, or the io_context, finds nothing left to report to.
 */
class HttpHostProbe : public HostProber {
public:
  // An empty resolver means ReverseLookup
  explicit HttpHostProbe(size_t resolver_threads = 4, bool resolve_names = true,
                         NameResolver resolver = {});

  void AsyncProbe(std::shared_ptr<boost::asio::io_context> io_context,
                  const std::string &address, uint16_t port,
                  std::chrono::milliseconds timeout,
                  ProbeCallback callback) override;

  // True when body is a JSON object containing the status marker field
  static bool IsValidStatusReply(const std::string &body);

private:
  void ValidateApi(std::shared_ptr<boost::asio::io_context> io_context,
                   const std::string &address, uint16_t port,
                   std::chrono::milliseconds timeout, ProbeCallback callback);
  void ResolveAndReport(std::shared_ptr<boost::asio::io_context> io_context,
                        const std::string &address, uint16_t port,
                        std::chrono::milliseconds timeout,
                        ProbeCallback callback);

  bool resolve_names_;
  NameResolver resolver_;
  util::ThreadPool resolver_pool_;
};

/**
 * Blocking reverse lookup (PTR). Returns std::nullopt when the address has
 * no name or the lookup fails. Runs on a resolver pool thread.
 */
std::optional<std::string> ReverseLookup(const std::string &address);

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_HOST_PROBE_HPP
