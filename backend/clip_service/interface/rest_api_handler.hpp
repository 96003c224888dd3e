#pragma once
#include "application/clip_service.hpp"
#include "domain/identity_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string_view>
#include <nlohmann/json.hpp>

namespace clip_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<ClipService> clip_service,
                 std::shared_ptr<IdentityService> identity_service);

  // Positive decimal id, as used in /api/routes/{id} and /api/videos/{id}.
  static std::optional<int64_t> parseId(std::string_view text);

  static nlohmann::json videoToJson(const VideoRecord& video);
  static nlohmann::json jobHistoryToJson(const JobHistoryRecord& record);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<ClipService> clip_service_;
  std::shared_ptr<IdentityService> identity_service_;

  std::expected<int64_t, std::string> authenticate(
      const http::request<http::string_body> &req);

  http::response<http::string_body> handleUploadVideo(
      const http::request<http::string_body> &req, int64_t user_id,
      std::optional<int64_t> route_id);
  http::response<http::string_body> handleGetVideo(int64_t video_id);
  http::response<http::string_body> handleListJobs(int64_t user_id);
};

} // namespace clip_service
