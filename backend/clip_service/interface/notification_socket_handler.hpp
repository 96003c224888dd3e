#pragma once
#include "application/clip_service.hpp"
#include "domain/identity_service.hpp"
#include "common/restful/websocket_session.hpp"
#include <memory>
#include <optional>

namespace clip_service {

// Accepts GET /ws/notifications upgrades carrying a token (query parameter
// "token" or a bearer header) and hands each session to ClipService.
class NotificationSocketHandler : public common::WebSocketHandlerBase {
public:
  NotificationSocketHandler(std::shared_ptr<ClipService> clip_service,
                            std::shared_ptr<IdentityService> identity_service);

  std::optional<http::response<http::string_body>> checkUpgrade(
    const http::request<http::string_body>& req) override;

  void onOpen(std::shared_ptr<common::WebSocketSession> session,
              const http::request<http::string_body>& req) override;

private:
  std::expected<int64_t, std::string> authenticate(const http::request<http::string_body>& req);

  std::shared_ptr<ClipService> clip_service_;
  std::shared_ptr<IdentityService> identity_service_;
};

}
