#include "websocket_channel.hpp"

namespace clip_service {

WebSocketChannel::WebSocketChannel(std::shared_ptr<common::WebSocketSession> session)
    : session_(std::move(session)) {}

std::expected<void, std::string> WebSocketChannel::send(const std::string& text) {
  if (!session_->send(text)) {
    return std::unexpected("WebSocket is closed");
  }
  return {};
}

void WebSocketChannel::close() {
  session_->close();
}

bool WebSocketChannel::isOpen() const {
  return session_->isOpen();
}

void WebSocketChannel::onDisconnect(DisconnectHandler handler) {
  session_->setCloseHandler(std::move(handler));
}

}
