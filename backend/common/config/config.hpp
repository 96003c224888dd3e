#pragma once

#include <cstddef>
#include <string>
#include <chrono>

namespace config {

struct ConnectionPoolConfig{
  size_t min_connections;
  size_t max_connections;
  std::chrono::milliseconds timeout;
  std::chrono::seconds idle_timeout;
};

struct DatabaseConfig {
  std::string backend;  // "mysql" or "memory"
  std::string host;
  unsigned int port;
  std::string user;
  std::string password;
  std::string db_name;
  std::string charset;
};

struct ServerConfig {
  std::string host;
  int port;
  int io_threads;
  size_t max_upload_bytes;
};

struct TranscodeConfig {
  std::string ffmpeg_path;
  std::string video_codec;  // encoder passed to -c:v, like "libx264"
  int crf;
  std::string preset;       // empty keeps the encoder default
  unsigned int worker_threads;
};

struct NotificationConfig {
  std::chrono::milliseconds tick_interval;
};

struct AuthConfig {
  std::string jwt_secret;
  std::string issuer;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Overrides the defaults with the sections present in a JSON file.
// Throws std::runtime_error when the file can't be read or parsed.
void loadFromFile(const std::string& path);
void loadFromEnvironment();

// Getters
const DatabaseConfig& getDatabase() const { return database_; }
const ConnectionPoolConfig& getDBCntPool() const { return db_cp_; }
const ServerConfig& getServer() const { return server_; }
const TranscodeConfig& getTranscode() const { return transcode_; }
const NotificationConfig& getNotification() const { return notification_; }
const AuthConfig& getAuth() const { return auth_; }
const std::string& getStoragePath() const { return storage_path_; }

private:
  Config();

  DatabaseConfig database_;
  ConnectionPoolConfig db_cp_;
  ServerConfig server_;
  TranscodeConfig transcode_;
  NotificationConfig notification_;
  AuthConfig auth_;
  std::string storage_path_;
};

} // namespace config
