#include "http_server.hpp"
#include <iostream>
#include <stdexcept>

namespace common {

namespace {

// Budget for receiving one request: a fixed allowance plus the time a full
// size body takes at 256 KiB/s.
std::chrono::seconds readTimeout(std::uint64_t body_limit) {
  return std::chrono::seconds(30 + body_limit / (256 * 1024));
}

} // namespace

HttpServer::HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
                       std::shared_ptr<RestApiHandlerBase> api_handler,
                       std::shared_ptr<WebSocketHandlerBase> ws_handler,
                       std::uint64_t body_limit)
  : ioc_(ioc), acceptor_(ioc), api_handler_(api_handler),
    ws_handler_(ws_handler), body_limit_(body_limit) {

  auto check = [](beast::error_code ec, const std::string& step) {
    if (ec) {
      throw std::runtime_error("[HttpServer] " + step + " failed: " + ec.message());
    }
  };

  beast::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  check(ec, "open");
  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  check(ec, "reuse_address");
  acceptor_.bind(endpoint, ec);
  check(ec, "bind to " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()));
  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  check(ec, "listen");
}

void HttpServer::run() {
  doAccept();
}

void HttpServer::stop() {
  net::post(acceptor_.get_executor(), [this]() {
    beast::error_code ec;
    acceptor_.close(ec);
  });
}

void HttpServer::doAccept() {
  acceptor_.async_accept(
    net::make_strand(ioc_),
    beast::bind_front_handler(&HttpServer::onAccept, this));
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }
  if (ec) {
    std::cerr << "[HttpServer] accept: " << ec.message() << std::endl;
  } else {
    std::make_shared<HttpSession>(std::move(socket), api_handler_, ws_handler_, body_limit_)->run();
  }

  doAccept();
}

HttpSession::HttpSession(tcp::socket&& socket,
                         std::shared_ptr<RestApiHandlerBase> api_handler,
                         std::shared_ptr<WebSocketHandlerBase> ws_handler,
                         std::uint64_t body_limit)
  : stream_(std::move(socket)), api_handler_(api_handler),
    ws_handler_(ws_handler), body_limit_(body_limit) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
  parser_.emplace();
  parser_->body_limit(body_limit_);

  stream_.expires_after(readTimeout(body_limit_));

  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream || ec == net::error::operation_aborted) {
    return doClose();
  }

  if (ec == http::error::body_limit) {
    std::cerr << "[HttpSession] rejected request over " << body_limit_ << " bytes" << std::endl;
    auto response = RestApiHandlerBase::createErrorResponse(
      http::status::payload_too_large, "Request body exceeds " + std::to_string(body_limit_) + " bytes");
    response.keep_alive(false);
    return writeResponse(std::move(response));
  }

  if (ec) {
    if (ec != beast::error::timeout) {
      std::cerr << "[HttpSession] read: " << ec.message() << std::endl;
    }
    return;
  }

  if (websocket::is_upgrade(parser_->get())) {
    return upgrade();
  }

  writeResponse(api_handler_->handleRequest(parser_->release()));
}

void HttpSession::upgrade() {
  const auto& req = parser_->get();

  if (!ws_handler_) {
    auto response = RestApiHandlerBase::createErrorResponse(http::status::not_found, "Endpoint not found");
    response.keep_alive(false);
    return writeResponse(std::move(response));
  }

  if (auto rejection = ws_handler_->checkUpgrade(req)) {
    rejection->keep_alive(false);
    return writeResponse(std::move(*rejection));
  }

  std::make_shared<WebSocketSession>(stream_.release_socket(), ws_handler_)->run(parser_->release());
}

void HttpSession::writeResponse(http::response<http::string_body>&& response) {
  auto res = std::make_shared<http::response<http::string_body>>(std::move(response));
  res_ = res;

  http::async_write(stream_, *res,
                    beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(),
                                            res->need_eof()));
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    std::cerr << "[HttpSession] write: " << ec.message() << std::endl;
    return;
  }

  if (close) {
    return doClose();
  }

  res_ = nullptr;
  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
