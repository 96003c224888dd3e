#pragma once
#include "domain/notification_channel.hpp"
#include "common/restful/websocket_session.hpp"
#include <memory>

namespace clip_service {

// NotificationChannel over an accepted websocket session.
class WebSocketChannel : public NotificationChannel {
public:
  explicit WebSocketChannel(std::shared_ptr<common::WebSocketSession> session);

  std::expected<void, std::string> send(const std::string& text) override;
  void close() override;
  bool isOpen() const override;
  void onDisconnect(DisconnectHandler handler) override;

private:
  std::shared_ptr<common::WebSocketSession> session_;
};

}
