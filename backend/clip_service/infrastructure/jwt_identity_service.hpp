#pragma once
#include "domain/identity_service.hpp"
#include "common/config/config.hpp"
#include <chrono>
#include <jwt-cpp/jwt.h>

namespace clip_service {

// HS256 tokens carrying the numeric user id in a "user_id" claim.
class JwtIdentityService : public IdentityService {
public:
  explicit JwtIdentityService(const config::AuthConfig& config);

  std::expected<int64_t, std::string> authenticate(const std::string& token) override;

  std::string createToken(int64_t user_id,
                          std::chrono::seconds ttl = std::chrono::hours(24)) const;

private:
  config::AuthConfig config_;
};

}
