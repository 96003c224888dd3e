#include "websocket_session.hpp"
#include <iostream>

namespace common {

WebSocketSession::WebSocketSession(tcp::socket&& socket, std::shared_ptr<WebSocketHandlerBase> handler)
  : ws_(std::move(socket)), handler_(std::move(handler)) {}

void WebSocketSession::run(http::request<http::string_body> req) {
  req_ = std::move(req);
  net::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
    // the http layer armed a read deadline; the websocket keeps its own pings
    beast::get_lowest_layer(self->ws_).expires_never();
    self->ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    self->ws_.async_accept(self->req_,
                           beast::bind_front_handler(&WebSocketSession::onAccept, self));
  });
}

void WebSocketSession::onAccept(beast::error_code ec) {
  if (ec) {
    std::cerr << "[WebSocketSession] accept error: " << ec.message() << std::endl;
    return finish();
  }

  open_.store(true, std::memory_order_release);
  if (handler_) {
    handler_->onOpen(shared_from_this(), req_);
  }

  if (close_pending_) {
    // close() raced the handshake
    return doClose();
  }
  doRead();
}

void WebSocketSession::doRead() {
  ws_.async_read(buffer_,
                 beast::bind_front_handler(&WebSocketSession::onRead, shared_from_this()));
}

void WebSocketSession::onRead(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
      std::cerr << "[WebSocketSession] read error: " << ec.message() << std::endl;
    }
    return finish();
  }

  // inbound frames carry nothing for us
  buffer_.consume(buffer_.size());
  doRead();
}

bool WebSocketSession::send(std::string text) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  if (closing_ || !open_.load(std::memory_order_acquire)) {
    return false;
  }
  net::post(ws_.get_executor(), [self = shared_from_this(), text = std::move(text)]() mutable {
    if (!self->open_.load(std::memory_order_acquire)) {
      // the connection ended under us; onRead/onWrite already logged why
      return;
    }
    self->outbox_.push_back(std::move(text));
    if (self->outbox_.size() == 1) {
      self->doWrite();
    }
  });
  return true;
}

void WebSocketSession::doWrite() {
  ws_.text(true);
  ws_.async_write(net::buffer(outbox_.front()),
                  beast::bind_front_handler(&WebSocketSession::onWrite, shared_from_this()));
}

void WebSocketSession::onWrite(beast::error_code ec, std::size_t bytes_transferred) {
  boost::ignore_unused(bytes_transferred);

  if (ec) {
    std::cerr << "[WebSocketSession] write error: " << ec.message()
              << " (" << outbox_.size() << " frame(s) dropped)" << std::endl;
    markClosing();
    open_.store(false, std::memory_order_release);
    outbox_.clear();
    // fail the pending read so the session tears down
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
    return;
  }

  outbox_.pop_front();
  if (!outbox_.empty()) {
    doWrite();
  } else if (close_pending_) {
    doClose();
  }
}

void WebSocketSession::close() {
  std::lock_guard<std::mutex> lock(send_mutex_);
  if (closing_) {
    return;
  }
  closing_ = true;
  // queued behind every frame send() accepted before this point
  net::post(ws_.get_executor(), [self = shared_from_this()]() {
    self->close_pending_ = true;
    if (!self->open_.load(std::memory_order_acquire)) {
      // handshake not finished yet (onAccept picks it up) or already gone
      return;
    }
    if (self->outbox_.empty()) {
      self->doClose();
    }
  });
}

bool WebSocketSession::markClosing() {
  std::lock_guard<std::mutex> lock(send_mutex_);
  return closing_.exchange(true);
}

void WebSocketSession::doClose() {
  ws_.async_close(websocket::close_code::normal,
    [self = shared_from_this()](beast::error_code ec) {
      if (ec) {
        beast::error_code ignored;
        beast::get_lowest_layer(self->ws_).socket().close(ignored);
      }
      self->finish();
    });
}

void WebSocketSession::setCloseHandler(CloseHandler handler) {
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (!finished_) {
      on_close_ = std::move(handler);
      return;
    }
  }
  if (handler) {
    handler();
  }
}

void WebSocketSession::finish() {
  CloseHandler handler;
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (finished_) {
      return;
    }
    finished_ = true;
    handler = std::move(on_close_);
  }
  markClosing();
  open_.store(false, std::memory_order_release);
  if (handler) {
    handler();
  }
}

}
