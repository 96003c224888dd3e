#include "notification_socket_handler.hpp"
#include "infrastructure/websocket_channel.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <iostream>

namespace clip_service {

namespace {

constexpr std::string_view kNotificationsPath = "/ws/notifications";

using common::RestApiHandlerBase;

} // namespace

NotificationSocketHandler::NotificationSocketHandler(std::shared_ptr<ClipService> clip_service,
                                                     std::shared_ptr<IdentityService> identity_service)
    : clip_service_(clip_service), identity_service_(identity_service) {}

std::expected<int64_t, std::string> NotificationSocketHandler::authenticate(
    const http::request<http::string_body>& req) {
  const std::string target = std::string(req.target());
  auto params = RestApiHandlerBase::queryParams(target);
  if (auto it = params.find("token"); it != params.end() && !it->second.empty()) {
    return identity_service_->authenticate(it->second);
  }
  if (auto token = RestApiHandlerBase::bearerToken(req)) {
    return identity_service_->authenticate(*token);
  }
  return std::unexpected("Missing token");
}

std::optional<http::response<http::string_body>> NotificationSocketHandler::checkUpgrade(
    const http::request<http::string_body>& req) {
  const std::string target = std::string(req.target());
  if (RestApiHandlerBase::targetPath(target) != kNotificationsPath) {
    return RestApiHandlerBase::createErrorResponse(http::status::not_found, "Endpoint not found");
  }

  auto user_id = authenticate(req);
  if (!user_id) {
    std::cerr << "[NotificationSocket] rejected upgrade: " << user_id.error() << std::endl;
    return RestApiHandlerBase::createErrorResponse(http::status::unauthorized, user_id.error());
  }
  return std::nullopt;
}

void NotificationSocketHandler::onOpen(std::shared_ptr<common::WebSocketSession> session,
                                       const http::request<http::string_body>& req) {
  // the token may have expired between the upgrade check and the handshake
  auto user_id = authenticate(req);
  if (!user_id) {
    std::cerr << "[NotificationSocket] closing session: " << user_id.error() << std::endl;
    session->close();
    return;
  }
  clip_service_->openNotificationChannel(*user_id, std::make_shared<WebSocketChannel>(session));
}

}
