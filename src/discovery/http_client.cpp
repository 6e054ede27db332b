// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/http_client.hpp"
#include "discovery/protocol.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"
#include <algorithm>
#include <cctype>

namespace llmmonitor {
namespace discovery {

namespace beast = boost::beast;
namespace http = boost::beast::http;

namespace {

std::string DescribeError(const boost::system::error_code &ec) {
  if (ec == beast::error::timeout) {
    return "timed out";
  }
  if (ec == http::error::body_limit) {
    return "response too large";
  }
  return ec.message();
}

std::string LowerName(beast::string_view name) {
  std::string out(name.data(), name.size());
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // namespace

HttpGetOperation::HttpGetOperation(boost::asio::io_context &io_context,
                                   std::string address, uint16_t port,
                                   std::string path, bool connect_only)
    : io_context_(io_context), stream_(io_context),
      address_(std::move(address)), port_(port), path_(std::move(path)),
      connect_only_(connect_only) {}

void HttpGetOperation::Start(boost::asio::io_context &io_context,
                             const std::string &address, uint16_t port,
                             const std::string &path,
                             std::chrono::milliseconds timeout,
                             HttpCallback callback) {
  auto op = std::shared_ptr<HttpGetOperation>(
      new HttpGetOperation(io_context, address, port, path, false));
  op->http_callback_ = std::move(callback);
  op->Run(timeout);
}

void HttpGetOperation::StartConnect(boost::asio::io_context &io_context,
                                    const std::string &address, uint16_t port,
                                    std::chrono::milliseconds timeout,
                                    ConnectCallback callback) {
  auto op = std::shared_ptr<HttpGetOperation>(
      new HttpGetOperation(io_context, address, port, "", true));
  op->connect_callback_ = std::move(callback);
  op->Run(timeout);
}

void HttpGetOperation::Run(std::chrono::milliseconds timeout) {
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address_, ec);
  if (ec) {
    boost::asio::post(io_context_, [self = shared_from_this()]() {
      self->Finish(std::nullopt, "invalid address");
    });
    return;
  }

  // One absolute deadline for every stage that follows
  stream_.expires_after(timeout);
  stream_.async_connect(
      boost::asio::ip::tcp::endpoint(ip, port_),
      [self = shared_from_this()](const boost::system::error_code &ec) {
        if (self->finished_) {
          return;
        }
        if (ec) {
          self->Finish(std::nullopt, "connect failed: " + DescribeError(ec));
          return;
        }
        self->OnConnected();
      });
}

void HttpGetOperation::OnConnected() {
  if (connect_only_) {
    Finish(HttpResponse{}, "");
    return;
  }

  request_.version(11);
  request_.method(http::verb::get);
  request_.target(path_);
  request_.set(http::field::host, util::FormatHostForUrl(address_) + ":" +
                                      std::to_string(port_));
  request_.set(http::field::user_agent, GetUserAgent());
  request_.set(http::field::accept, "application/json");
  request_.set(http::field::connection, "close");

  http::async_write(
      stream_, request_,
      [self = shared_from_this()](const boost::system::error_code &ec, size_t) {
        if (self->finished_) {
          return;
        }
        if (ec) {
          self->Finish(std::nullopt, "write failed: " + DescribeError(ec));
          return;
        }
        self->OnWritten();
      });
}

void HttpGetOperation::OnWritten() {
  parser_.body_limit(protocol::MAX_HTTP_RESPONSE_SIZE);

  http::async_read(
      stream_, buffer_, parser_,
      [self = shared_from_this()](const boost::system::error_code &ec, size_t) {
        if (self->finished_) {
          return;
        }
        if (ec) {
          self->Finish(std::nullopt, "read failed: " + DescribeError(ec));
          return;
        }

        auto &message = self->parser_.get();
        HttpResponse response;
        response.status = static_cast<int>(message.result_int());
        for (const auto &field : message) {
          auto value = field.value();
          response.headers[LowerName(field.name_string())] =
              std::string(value.data(), value.size());
        }
        response.body = std::move(message.body());
        self->Finish(std::move(response), "");
      });
}

void HttpGetOperation::Finish(std::optional<HttpResponse> response,
                              const std::string &error) {
  if (finished_) {
    return;
  }
  finished_ = true;
  boost::system::error_code ignored;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                            ignored);
  stream_.close();

  if (!error.empty()) {
    LOG_DISC_TRACE("http {}:{}{}: {}", address_, port_, path_, error);
  }

  try {
    if (connect_only_) {
      if (connect_callback_) {
        connect_callback_(response.has_value());
      }
    } else if (http_callback_) {
      http_callback_(std::move(response), error);
    }
  } catch (const std::exception &e) {
    LOG_DISC_WARN("exception in http callback for {}:{}: {}", address_, port_,
                  e.what());
  }
}

std::optional<HttpResponse> HttpGet(const std::string &address, uint16_t port,
                                    const std::string &path,
                                    std::chrono::milliseconds timeout,
                                    std::string *error_out) {
  boost::asio::io_context io_context;
  std::optional<HttpResponse> result;
  std::string error;

  HttpGetOperation::Start(
      io_context, address, port, path, timeout,
      [&result, &error](std::optional<HttpResponse> response,
                        const std::string &err) {
        result = std::move(response);
        error = err;
      });
  io_context.run();

  if (error_out) {
    *error_out = error;
  }
  return result;
}

} // namespace discovery
} // namespace llmmonitor
