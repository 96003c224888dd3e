#pragma once
#include <cstdint>
#include <expected>
#include <string>

namespace clip_service {
class IdentityService {
public:
  virtual ~IdentityService() = default;
  // return user_id
  virtual std::expected<int64_t, std::string> authenticate(const std::string& token) = 0;
};
}
