// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license
// HTTP/1.1 GET over boost::beast, bounded by a single deadline

#ifndef LLMMONITOR_DISCOVERY_HTTP_CLIENT_HPP
#define LLMMONITOR_DISCOVERY_HTTP_CLIENT_HPP

#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace llmmonitor {
namespace discovery {

struct HttpResponse {
  int status{0};
  std::map<std::string, std::string> headers; // lower-case names
  std::string body;
};

// Exactly one of response / error is meaningful
using HttpCallback = std::function<void(std::optional<HttpResponse> response,
                                        const std::string &error)>;
using ConnectCallback = std::function<void(bool connected)>;

/**
 * HttpGetOperation - one GET request against a numeric address
 *
 * The beast::tcp_stream deadline is armed once, so the timeout bounds
 * connect, write and read together. Bodies are framed by the beast parser
 * (Content-Length, chunked or connection close) and capped at
 * protocol::MAX_HTTP_RESPONSE_SIZE.
 *
 * The callback runs exactly once, always from the io_context (never from
 * inside Start()).
 */
class HttpGetOperation
    : public std::enable_shared_from_this<HttpGetOperation> {
public:
  static void Start(boost::asio::io_context &io_context,
                    const std::string &address, uint16_t port,
                    const std::string &path,
                    std::chrono::milliseconds timeout, HttpCallback callback);

  // TCP reachability check only: connect, close, report
  static void StartConnect(boost::asio::io_context &io_context,
                           const std::string &address, uint16_t port,
                           std::chrono::milliseconds timeout,
                           ConnectCallback callback);

private:
  HttpGetOperation(boost::asio::io_context &io_context, std::string address,
                   uint16_t port, std::string path, bool connect_only);

  void Run(std::chrono::milliseconds timeout);
  void OnConnected();
  void OnWritten();
  void Finish(std::optional<HttpResponse> response, const std::string &error);

  boost::asio::io_context &io_context_;
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::empty_body> request_;
  boost::beast::http::response_parser<boost::beast::http::string_body> parser_;

  std::string address_;
  uint16_t port_;
  std::string path_;
  bool connect_only_;

  bool finished_{false};
  HttpCallback http_callback_;
  ConnectCallback connect_callback_;
};

/**
 * Blocking GET on a private io_context, for callers outside the scan pass
 * (backend status queries). Returns std::nullopt on any failure; the reason
 * is written to error_out when given.
 */
std::optional<HttpResponse> HttpGet(const std::string &address, uint16_t port,
                                    const std::string &path,
                                    std::chrono::milliseconds timeout,
                                    std::string *error_out = nullptr);

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_HTTP_CLIENT_HPP
