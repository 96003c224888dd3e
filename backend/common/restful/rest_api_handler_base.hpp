#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  template<class Body, class Allocator>
  http::response<http::string_body> handleRequest(
    http::request<Body, http::basic_fields<Allocator>>&& req) {

    auto addCorsHeaders = [](auto& res) {
      res.set(http::field::access_control_allow_origin, "*");
      res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
      res.set(http::field::access_control_allow_headers, "Content-Type, Authorization, X-Filename");
    };

    if (req.method() == http::verb::options) {
      http::response<http::string_body> res{http::status::ok, req.version()};
      addCorsHeaders(res);
      res.prepare_payload();
      return res;
    }

    const auto version = req.version();
    const auto keep_alive = req.keep_alive();
    try {
      auto response = doHandleRequest(std::move(req));
      response.version(version);
      response.keep_alive(keep_alive);
      addCorsHeaders(response);
      return response;
    } catch (const std::exception& e) {
      auto response = createErrorResponse(http::status::internal_server_error,
                                        "Internal server error: " + std::string(e.what()));
      response.version(version);
      response.keep_alive(keep_alive);
      addCorsHeaders(response);
      return response;
    }
  }

  // Splits "/a/b?x=1&y=2" into its path and percent-decoded query parameters.
  static std::string_view targetPath(std::string_view target);
  static std::map<std::string, std::string> queryParams(std::string_view target);

  // Value of an "Authorization: Bearer <token>" header, if present.
  template<class Fields>
  static std::optional<std::string> bearerToken(const Fields& fields) {
    auto it = fields.find(http::field::authorization);
    if (it == fields.end()) {
      return std::nullopt;
    }
    beast::string_view value = it->value();
    const beast::string_view prefix{"Bearer "};
    if (value.size() <= prefix.size() ||
        !beast::iequals(value.substr(0, prefix.size()), prefix)) {
      return std::nullopt;
    }
    value.remove_prefix(prefix.size());
    return std::string(value.data(), value.size());
  }

  static http::response<http::string_body> createJsonResponse(
    http::status status, const nlohmann::json& json);

  static http::response<http::string_body> createErrorResponse(
    http::status status, const std::string& message);

protected:
  virtual http::response<http::string_body> doHandleRequest(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>&& req) = 0;
};

}
