#include "config.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace config {

  Config::Config() {
    database_ = {
      .backend = "mysql",
      .host = "localhost",
      .port = 3306,
      .user = "root",
      .password = "",
      .db_name = "cragclip_db",
      .charset = "utf8mb4",
    };

    db_cp_ = {
      .min_connections = 4,
      .max_connections = 16,
      .timeout = std::chrono::milliseconds(5000),
      .idle_timeout = std::chrono::seconds(600)
    };

    server_ = {
      .host = "0.0.0.0",
      .port = 8080,
      .io_threads = 1,
      .max_upload_bytes = 512 * 1024 * 1024
    };

    transcode_ = {
      .ffmpeg_path = "ffmpeg",
      .video_codec = "libx264",
      .crf = 30,
      .preset = "",
      .worker_threads = 2
    };

    notification_ = {
      .tick_interval = std::chrono::milliseconds(5000)
    };

    auth_ = {
      .jwt_secret = "",
      .issuer = "cragclip"
    };

    storage_path_ = (std::filesystem::current_path() / "videos").string();
  }

  void Config::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
      j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }

    try {
      if (j.contains("database")) {
        const auto& db = j.at("database");
        database_.backend = db.value("backend", database_.backend);
        database_.host = db.value("host", database_.host);
        database_.port = db.value("port", database_.port);
        database_.user = db.value("user", database_.user);
        database_.password = db.value("password", database_.password);
        database_.db_name = db.value("db_name", database_.db_name);
        database_.charset = db.value("charset", database_.charset);
      }

      if (j.contains("db_pool")) {
        const auto& cp = j.at("db_pool");
        db_cp_.min_connections = cp.value("min_connections", db_cp_.min_connections);
        db_cp_.max_connections = cp.value("max_connections", db_cp_.max_connections);
        db_cp_.timeout = std::chrono::milliseconds(cp.value("timeout_ms", db_cp_.timeout.count()));
        db_cp_.idle_timeout = std::chrono::seconds(cp.value("idle_timeout_s", db_cp_.idle_timeout.count()));
      }

      if (j.contains("server")) {
        const auto& srv = j.at("server");
        server_.host = srv.value("host", server_.host);
        server_.port = srv.value("port", server_.port);
        server_.io_threads = srv.value("io_threads", server_.io_threads);
        server_.max_upload_bytes = srv.value("max_upload_bytes", server_.max_upload_bytes);
      }

      if (j.contains("transcode")) {
        const auto& tc = j.at("transcode");
        transcode_.ffmpeg_path = tc.value("ffmpeg_path", transcode_.ffmpeg_path);
        transcode_.video_codec = tc.value("video_codec", transcode_.video_codec);
        transcode_.crf = tc.value("crf", transcode_.crf);
        transcode_.preset = tc.value("preset", transcode_.preset);
        transcode_.worker_threads = tc.value("worker_threads", transcode_.worker_threads);
      }

      if (j.contains("notification")) {
        const auto& nt = j.at("notification");
        notification_.tick_interval =
          std::chrono::milliseconds(nt.value("tick_interval_ms", notification_.tick_interval.count()));
      }

      if (j.contains("auth")) {
        const auto& au = j.at("auth");
        auth_.jwt_secret = au.value("jwt_secret", auth_.jwt_secret);
        auth_.issuer = au.value("issuer", auth_.issuer);
      }

      storage_path_ = j.value("storage_path", storage_path_);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error("Bad value in config file " + path + ": " + e.what());
    }
  }

  void Config::loadFromEnvironment() {
    if (const char* secret = std::getenv("CRAGCLIP_JWT_SECRET"); secret && *secret) {
      auth_.jwt_secret = secret;
    }
  }
}
