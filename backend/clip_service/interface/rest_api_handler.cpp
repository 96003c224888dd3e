#include "rest_api_handler.hpp"
#include <charconv>
#include <iostream>

namespace clip_service {

namespace {

constexpr std::string_view kRoutesPrefix = "/api/routes/";
constexpr std::string_view kRouteVideoSuffix = "/video";
constexpr std::string_view kVideosPath = "/api/videos";
constexpr std::string_view kJobsPath = "/api/jobs";
constexpr const char* kDefaultFileName = "video.mp4";

int64_t toMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json optionalId(const std::optional<int64_t>& id) {
  return id ? nlohmann::json(*id) : nlohmann::json(nullptr);
}

} // namespace

RestApiHandler::RestApiHandler(std::shared_ptr<ClipService> clip_service,
                               std::shared_ptr<IdentityService> identity_service)
    : clip_service_(clip_service), identity_service_(identity_service) {}

std::optional<int64_t> RestApiHandler::parseId(std::string_view text) {
  int64_t id = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
  if (text.empty() || ec != std::errc{} || end != text.data() + text.size() || id <= 0) {
    return std::nullopt;
  }
  return id;
}

nlohmann::json RestApiHandler::videoToJson(const VideoRecord& video) {
  return {
    {"id", video.id},
    {"path", video.path},
    {"route_id", optionalId(video.route_id)},
    {"completed", video.completed},
    {"failed", video.failed},
    {"created_at", toMillis(video.created_at)}
  };
}

nlohmann::json RestApiHandler::jobHistoryToJson(const JobHistoryRecord& record) {
  return {
    {"id", record.id},
    {"created_at", toMillis(record.created_at)},
    {"user_id", record.user_id},
    {"video_id", record.video_id},
    {"route_id", optionalId(record.route_id)},
    {"completed", record.completed}
  };
}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  const std::string target = std::string(req.target());
  const std::string_view path = targetPath(target);

  auto user_id = authenticate(req);
  if (!user_id) {
    return createErrorResponse(http::status::unauthorized, user_id.error());
  }

  if (path.starts_with(kRoutesPrefix) && path.ends_with(kRouteVideoSuffix) &&
      req.method() == http::verb::post) {
    auto id_text = path.substr(kRoutesPrefix.size(),
                               path.size() - kRoutesPrefix.size() - kRouteVideoSuffix.size());
    auto route_id = parseId(id_text);
    if (!route_id) {
      return createErrorResponse(http::status::bad_request, "Invalid route id");
    }
    return handleUploadVideo(req, *user_id, route_id);
  } else if (path == kVideosPath && req.method() == http::verb::post) {
    return handleUploadVideo(req, *user_id, std::nullopt);
  } else if (path.starts_with(kVideosPath) && path.size() > kVideosPath.size() + 1 &&
             path[kVideosPath.size()] == '/' && req.method() == http::verb::get) {
    auto video_id = parseId(path.substr(kVideosPath.size() + 1));
    if (!video_id) {
      return createErrorResponse(http::status::bad_request, "Invalid video id");
    }
    return handleGetVideo(*video_id);
  } else if (path == kJobsPath && req.method() == http::verb::get) {
    return handleListJobs(*user_id);
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

std::expected<int64_t, std::string> RestApiHandler::authenticate(
    const http::request<http::string_body> &req) {
  auto token = bearerToken(req);
  if (!token) {
    return std::unexpected("Missing authorization header");
  }
  return identity_service_->authenticate(*token);
}

http::response<http::string_body> RestApiHandler::handleUploadVideo(
    const http::request<http::string_body> &req, int64_t user_id,
    std::optional<int64_t> route_id) {
  if (req.body().empty()) {
    return createErrorResponse(http::status::bad_request, "Empty request body");
  }

  std::string filename = kDefaultFileName;
  auto params = queryParams(std::string_view(req.target().data(), req.target().size()));
  if (auto it = params.find("filename"); it != params.end() && !it->second.empty()) {
    filename = it->second;
  } else if (auto header = req.find("X-Filename"); header != req.end() && !header->value().empty()) {
    filename = std::string(header->value().data(), header->value().size());
  }

  auto result = clip_service_->ingest(user_id, route_id, req.body(), filename);
  if (!result) {
    std::cerr << "[RestApiHandler] upload from user " << user_id << " failed: "
              << result.error() << std::endl;
    return createErrorResponse(http::status::internal_server_error, result.error());
  }

  nlohmann::json response_json = {{"success", true}, {"video_id", result.value()}};
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body> RestApiHandler::handleGetVideo(int64_t video_id) {
  auto video = clip_service_->getVideo(video_id);
  if (!video) {
    return createErrorResponse(http::status::not_found, video.error());
  }
  return createJsonResponse(http::status::ok, videoToJson(*video));
}

http::response<http::string_body> RestApiHandler::handleListJobs(int64_t user_id) {
  auto records = clip_service_->listJobHistory(user_id);
  if (!records) {
    return createErrorResponse(http::status::internal_server_error, records.error());
  }

  nlohmann::json jobs = nlohmann::json::array();
  for (const auto& record : *records) {
    jobs.push_back(jobHistoryToJson(record));
  }
  nlohmann::json response_json = {{"success", true}, {"jobs", jobs}};
  return createJsonResponse(http::status::ok, response_json);
}

} // namespace clip_service
