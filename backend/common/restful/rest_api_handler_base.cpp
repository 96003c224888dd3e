#include "rest_api_handler_base.hpp"

namespace common {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string percentDecode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '+') {
      out += ' ';
    } else if (in[i] == '%' && i + 2 < in.size() &&
               hexValue(in[i + 1]) >= 0 && hexValue(in[i + 2]) >= 0) {
      out += static_cast<char>(hexValue(in[i + 1]) * 16 + hexValue(in[i + 2]));
      i += 2;
    } else {
      out += in[i];
    }
  }
  return out;
}

} // namespace

std::string_view RestApiHandlerBase::targetPath(std::string_view target) {
  return target.substr(0, target.find('?'));
}

std::map<std::string, std::string> RestApiHandlerBase::queryParams(std::string_view target) {
  std::map<std::string, std::string> params;
  auto pos = target.find('?');
  if (pos == std::string_view::npos) {
    return params;
  }

  std::string_view query = target.substr(pos + 1);
  while (!query.empty()) {
    auto amp = query.find('&');
    std::string_view pair = query.substr(0, amp);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string_view::npos) {
        params[percentDecode(pair)] = "";
      } else {
        params[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
      }
    }
    if (amp == std::string_view::npos) break;
    query.remove_prefix(amp + 1);
  }
  return params;
}

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

}
