#include <gtest/gtest.h>

#include "infrastructure/jwt_identity_service.hpp"

namespace clip_service {
namespace {

config::AuthConfig authConfig(const std::string& secret, const std::string& issuer = "cragclip") {
  return config::AuthConfig{.jwt_secret = secret, .issuer = issuer};
}

TEST(JwtIdentityServiceTest, AcceptsItsOwnTokens) {
  JwtIdentityService identity(authConfig("secret"));
  auto user_id = identity.authenticate(identity.createToken(3));
  ASSERT_TRUE(user_id) << user_id.error();
  EXPECT_EQ(*user_id, 3);
}

TEST(JwtIdentityServiceTest, RejectsForeignSecretOrIssuer) {
  JwtIdentityService identity(authConfig("secret"));
  JwtIdentityService other_secret(authConfig("another secret"));
  JwtIdentityService other_issuer(authConfig("secret", "someone-else"));

  EXPECT_FALSE(identity.authenticate(other_secret.createToken(3)));
  EXPECT_FALSE(identity.authenticate(other_issuer.createToken(3)));
}

TEST(JwtIdentityServiceTest, RejectsExpiredAndMalformedTokens) {
  JwtIdentityService identity(authConfig("secret"));
  EXPECT_FALSE(identity.authenticate(identity.createToken(3, std::chrono::seconds(-60))));
  EXPECT_FALSE(identity.authenticate("not-a-jwt"));
  EXPECT_FALSE(identity.authenticate(""));
}

TEST(JwtIdentityServiceTest, RequiresNumericUserClaim) {
  const std::string token = jwt::create()
    .set_issuer("cragclip")
    .set_issued_now()
    .set_payload_claim("user_id", jwt::claim(std::string("alice")))
    .sign(jwt::algorithm::hs256{"secret"});

  JwtIdentityService identity(authConfig("secret"));
  EXPECT_FALSE(identity.authenticate(token));
}

} // namespace
} // namespace clip_service
