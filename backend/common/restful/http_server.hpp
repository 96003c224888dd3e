#pragma once
#include <memory>
#include <optional>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include "common/restful/rest_api_handler_base.hpp"
#include "common/restful/websocket_session.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket,
              std::shared_ptr<RestApiHandlerBase> api_handler,
              std::shared_ptr<WebSocketHandlerBase> ws_handler,
              std::uint64_t body_limit);

  void run();

private:
  void doRead();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
  void doClose();
  void upgrade();
  void writeResponse(http::response<http::string_body>&& response);

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<void> res_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  std::shared_ptr<WebSocketHandlerBase> ws_handler_;
  std::uint64_t body_limit_;
};

class HttpServer {
public:
  HttpServer(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<RestApiHandlerBase> api_handler,
             std::shared_ptr<WebSocketHandlerBase> ws_handler = nullptr,
             std::uint64_t body_limit = 8 * 1024 * 1024);

  void run();
  void stop();

  // the bound address, with the actual port when constructed with port 0
  tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
  void doAccept();
  void onAccept(beast::error_code ec, tcp::socket socket);

  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<RestApiHandlerBase> api_handler_;
  std::shared_ptr<WebSocketHandlerBase> ws_handler_;
  std::uint64_t body_limit_;
};

}
