#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

#include "common/config/config.hpp"
#include "test_support.hpp"

namespace config {
namespace {

using clip_service::test::TempDir;

TEST(ConfigTest, DefaultsAreUsable) {
  const auto& cfg = Config::getInstance();
  EXPECT_GE(cfg.getTranscode().crf, 0);
  EXPECT_FALSE(cfg.getTranscode().video_codec.empty());
  EXPECT_GT(cfg.getNotification().tick_interval.count(), 0);
  EXPECT_FALSE(cfg.getStoragePath().empty());
}

TEST(ConfigTest, FileOverridesOnlyTheKeysItNames) {
  TempDir dir;
  const auto path = dir.path() / "cragclip.json";
  std::ofstream(path) << R"({
    "database": { "backend": "memory" },
    "server": { "port": 9090, "max_upload_bytes": 1048576 },
    "storage_path": "/srv/clips",
    "transcode": { "ffmpeg_path": "/opt/ffmpeg/bin/ffmpeg", "crf": 26, "preset": "fast" },
    "notification": { "tick_interval_ms": 250 },
    "auth": { "jwt_secret": "s3cret" }
  })";

  auto& cfg = Config::getInstance();
  const auto host_before = cfg.getServer().host;
  const auto codec_before = cfg.getTranscode().video_codec;
  cfg.loadFromFile(path.string());

  EXPECT_EQ(cfg.getDatabase().backend, "memory");
  EXPECT_EQ(cfg.getServer().port, 9090);
  EXPECT_EQ(cfg.getServer().max_upload_bytes, 1048576u);
  EXPECT_EQ(cfg.getServer().host, host_before);
  EXPECT_EQ(cfg.getStoragePath(), "/srv/clips");
  EXPECT_EQ(cfg.getTranscode().ffmpeg_path, "/opt/ffmpeg/bin/ffmpeg");
  EXPECT_EQ(cfg.getTranscode().crf, 26);
  EXPECT_EQ(cfg.getTranscode().preset, "fast");
  EXPECT_EQ(cfg.getTranscode().video_codec, codec_before);
  EXPECT_EQ(cfg.getNotification().tick_interval, std::chrono::milliseconds(250));
  EXPECT_EQ(cfg.getAuth().jwt_secret, "s3cret");
}

TEST(ConfigTest, EnvironmentOverridesSecret) {
  ::setenv("CRAGCLIP_JWT_SECRET", "from-env", 1);
  auto& cfg = Config::getInstance();
  cfg.loadFromEnvironment();
  EXPECT_EQ(cfg.getAuth().jwt_secret, "from-env");
  ::unsetenv("CRAGCLIP_JWT_SECRET");
}

TEST(ConfigTest, UnreadableOrInvalidFilesThrow) {
  auto& cfg = Config::getInstance();
  EXPECT_THROW(cfg.loadFromFile("/nonexistent/cragclip.json"), std::runtime_error);

  TempDir dir;
  const auto broken = dir.path() / "broken.json";
  std::ofstream(broken) << "{ not json";
  EXPECT_THROW(cfg.loadFromFile(broken.string()), std::runtime_error);

  const auto wrong_type = dir.path() / "wrong_type.json";
  std::ofstream(wrong_type) << R"({ "server": { "port": "eighty" } })";
  EXPECT_THROW(cfg.loadFromFile(wrong_type.string()), std::runtime_error);
}

} // namespace
} // namespace config
