#include "jwt_identity_service.hpp"
#include <charconv>

namespace clip_service {

JwtIdentityService::JwtIdentityService(const config::AuthConfig& config)
    : config_(config) {}

std::expected<int64_t, std::string> JwtIdentityService::authenticate(const std::string& token) {
  if (token.empty()) {
    return std::unexpected("Missing token");
  }
  try {
    auto decoded = jwt::decode(token);
    auto verifier = jwt::verify()
      .allow_algorithm(jwt::algorithm::hs256{config_.jwt_secret});
    if (!config_.issuer.empty()) {
      verifier.with_issuer(config_.issuer);
    }
    verifier.verify(decoded);

    if (!decoded.has_payload_claim("user_id")) {
      return std::unexpected("Token has no user_id");
    }
    auto claim = decoded.get_payload_claim("user_id");
    if (claim.get_type() == jwt::json::type::integer) {
      return static_cast<int64_t>(claim.as_integer());
    }

    auto user_id = claim.as_string();
    int64_t id = 0;
    auto [end, ec] = std::from_chars(user_id.data(), user_id.data() + user_id.size(), id);
    if (ec != std::errc{} || end != user_id.data() + user_id.size()) {
      return std::unexpected("Invalid user_id in token");
    }
    return id;
  } catch (std::exception&) {
    return std::unexpected("Invalid token");
  }
}

std::string JwtIdentityService::createToken(int64_t user_id, std::chrono::seconds ttl) const {
  auto builder = jwt::create()
    .set_type("JWT")
    .set_issued_now()
    .set_expires_in(ttl)
    .set_payload_claim("user_id", jwt::claim(std::to_string(user_id)));
  if (!config_.issuer.empty()) {
    builder.set_issuer(config_.issuer);
  }
  return builder.sign(jwt::algorithm::hs256{config_.jwt_secret});
}

}
