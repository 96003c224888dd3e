#pragma once
#include <expected>
#include <functional>
#include <string>

namespace clip_service {

// Duplex, message-oriented connection to one user. The transport has already
// accepted it by the time the core sees it.
class NotificationChannel {
public:
  using DisconnectHandler = std::function<void()>;
  virtual ~NotificationChannel() = default;
  virtual std::expected<void, std::string> send(const std::string& text) = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
  // Fires once when the channel goes away (peer disconnect, close(), error).
  // Fires immediately if that has already happened.
  virtual void onDisconnect(DisconnectHandler handler) = 0;
};

}
