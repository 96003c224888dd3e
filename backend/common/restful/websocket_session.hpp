#pragma once
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace common {

class WebSocketSession;

class WebSocketHandlerBase {
public:
  virtual ~WebSocketHandlerBase() = default;

  // Called before the handshake. Returning a response rejects the upgrade
  // and that response is written instead.
  virtual std::optional<http::response<http::string_body>> checkUpgrade(
    const http::request<http::string_body>& req) = 0;

  // Called once the handshake has completed.
  virtual void onOpen(std::shared_ptr<WebSocketSession> session,
                      const http::request<http::string_body>& req) = 0;
};

// Server side of one websocket connection. Writes are queued and serialized on
// the session's strand; send() and close() may be called from any thread.
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
  using CloseHandler = std::function<void()>;

  WebSocketSession(tcp::socket&& socket, std::shared_ptr<WebSocketHandlerBase> handler);

  void run(http::request<http::string_body> req);

  // Queues a text frame. false once close() has been called or the connection
  // has ended; a frame accepted here is written before the close frame.
  bool send(std::string text);
  void close();
  bool isOpen() const {
    return open_.load(std::memory_order_acquire) && !closing_.load(std::memory_order_acquire);
  }

  // Invoked exactly once when the connection ends, whatever the cause. If it
  // has already ended the handler runs immediately.
  void setCloseHandler(CloseHandler handler);

private:
  void onAccept(beast::error_code ec);
  void doRead();
  void onRead(beast::error_code ec, std::size_t bytes_transferred);
  void doWrite();
  void onWrite(beast::error_code ec, std::size_t bytes_transferred);
  void doClose();
  void finish();
  // Sets closing_; returns its previous value.
  bool markClosing();

  websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<WebSocketHandlerBase> handler_;
  std::deque<std::string> outbox_;
  bool close_pending_{false};  // strand only
  std::atomic<bool> open_{false};

  // closing_ only changes under send_mutex_, so a frame is either queued
  // ahead of the close or refused
  std::mutex send_mutex_;
  std::atomic<bool> closing_{false};

  std::mutex close_mutex_;
  bool finished_{false};
  CloseHandler on_close_;
};

}
