// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/host_probe.hpp"
#include "discovery/http_client.hpp"
#include "discovery/protocol.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <netdb.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>

namespace llmmonitor {
namespace discovery {

namespace {

// Owned by the pending deadline handler only, so it dies with the
// io_context. The lookup task sees it through a weak_ptr.
struct ResolveState {
  using Report = std::function<void(std::optional<std::string>)>;

  ResolveState(boost::asio::io_context &io_context, Report report_fn)
      : timer(io_context), report(std::move(report_fn)) {}

  // io_context thread only
  void Complete(std::optional<std::string> name) {
    if (done) {
      return;
    }
    done = true;
    timer.cancel();
    report(std::move(name));
  }

  boost::asio::steady_timer timer;
  Report report;
  bool done{false};
};

} // namespace

std::optional<std::string> ReverseLookup(const std::string &address) {
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  boost::asio::ip::tcp::endpoint endpoint(ip, 0);
  char host[NI_MAXHOST] = {};
  int rc = getnameinfo(endpoint.data(), static_cast<socklen_t>(endpoint.size()),
                       host, sizeof(host), nullptr, 0, NI_NAMEREQD);
  if (rc != 0) {
    LOG_DISC_TRACE("Could not resolve hostname for {}: {}", address,
                   gai_strerror(rc));
    return std::nullopt;
  }

  std::string name(host);
  if (name.empty() || name == address) {
    return std::nullopt;
  }
  return name;
}

HttpHostProbe::HttpHostProbe(size_t resolver_threads, bool resolve_names,
                             NameResolver resolver)
    : resolve_names_(resolve_names),
      resolver_(resolver ? std::move(resolver) : NameResolver(ReverseLookup)),
      resolver_pool_(resolver_threads == 0 ? 1 : resolver_threads) {}

bool HttpHostProbe::IsValidStatusReply(const std::string &body) {
  auto data = nlohmann::json::parse(body, nullptr, false);
  if (data.is_discarded() || !data.is_object()) {
    return false;
  }
  return data.contains(protocol::STATUS_MARKER_FIELD);
}

void HttpHostProbe::AsyncProbe(
    std::shared_ptr<boost::asio::io_context> io_context,
    const std::string &address, uint16_t port,
    std::chrono::milliseconds timeout, ProbeCallback callback) {
  std::weak_ptr<boost::asio::io_context> weak_io = io_context;

  HttpGetOperation::StartConnect(
      *io_context, address, port, timeout,
      [this, weak_io, address, port, timeout,
       callback = std::move(callback)](bool connected) mutable {
        if (!connected) {
          LOG_DISC_TRACE("Port {} not accessible on {}", port, address);
          callback(std::nullopt);
          return;
        }
        LOG_DISC_TRACE("Port {} is open on {}", port, address);

        auto io = weak_io.lock();
        if (!io) {
          return;
        }
        ValidateApi(io, address, port, timeout, std::move(callback));
      });
}

void HttpHostProbe::ValidateApi(
    std::shared_ptr<boost::asio::io_context> io_context,
    const std::string &address, uint16_t port,
    std::chrono::milliseconds timeout, ProbeCallback callback) {
  std::weak_ptr<boost::asio::io_context> weak_io = io_context;

  HttpGetOperation::Start(
      *io_context, address, port, protocol::paths::PROCESS_STATUS, timeout,
      [this, weak_io, address, port, timeout, callback = std::move(callback)](
          std::optional<HttpResponse> response,
          const std::string &error) mutable {
        if (!response) {
          LOG_DISC_TRACE("HTTP error validating {}:{}: {}", address, port,
                         error);
          callback(std::nullopt);
          return;
        }
        if (response->status != 200) {
          LOG_DISC_TRACE("API endpoint returned status {} for {}:{}",
                         response->status, address, port);
          callback(std::nullopt);
          return;
        }
        if (!IsValidStatusReply(response->body)) {
          LOG_DISC_TRACE("Invalid response format from {}:{}", address, port);
          callback(std::nullopt);
          return;
        }
        LOG_DISC_DEBUG("Valid API found at {}:{}", address, port);

        auto io = weak_io.lock();
        if (!io) {
          return;
        }
        ResolveAndReport(io, address, port, timeout, std::move(callback));
      });
}

void HttpHostProbe::ResolveAndReport(
    std::shared_ptr<boost::asio::io_context> io_context,
    const std::string &address, uint16_t port,
    std::chrono::milliseconds timeout, ProbeCallback callback) {
  auto report = [address, port, callback](std::optional<std::string> name) {
    DiscoveryEvent event;
    event.address = address;
    event.port = port;
    event.hostname = std::move(name);
    event.timestamp = util::GetTime();
    event.is_online = true;
    if (event.hostname) {
      LOG_DISC_INFO("Discovered host: {}:{} (hostname: {})", address, port,
                    *event.hostname);
    } else {
      LOG_DISC_INFO("Discovered host: {}:{}", address, port);
    }
    callback(std::move(event));
  };

  if (!resolve_names_) {
    boost::asio::post(*io_context, [report]() { report(std::nullopt); });
    return;
  }

  auto state = std::make_shared<ResolveState>(*io_context, report);
  std::weak_ptr<ResolveState> weak_state = state;

  state->timer.expires_after(timeout);
  state->timer.async_wait(
      [state, address](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        LOG_DISC_TRACE("Reverse lookup for {} timed out", address);
        state->Complete(std::nullopt);
      });

  std::weak_ptr<boost::asio::io_context> weak_io = io_context;
  try {
    resolver_pool_.enqueue([weak_io, weak_state, address,
                            resolver = resolver_]() {
      std::optional<std::string> name;
      try {
        name = resolver(address);
      } catch (const std::exception &e) {
        LOG_DISC_WARN("Reverse lookup for {} failed: {}", address, e.what());
      }
      // Pass already torn down: nothing left to report to
      if (auto io = weak_io.lock()) {
        boost::asio::post(*io, [weak_state, name]() {
          if (auto live = weak_state.lock()) {
            live->Complete(name);
          }
        });
      }
    });
  } catch (const std::runtime_error &e) {
    LOG_DISC_WARN("Reverse lookup for {} not scheduled: {}", address, e.what());
    boost::asio::post(*io_context, [weak_state]() {
      if (auto live = weak_state.lock()) {
        live->Complete(std::nullopt);
      }
    });
  }
}

} // namespace discovery
} // namespace llmmonitor
