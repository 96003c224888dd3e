#pragma once
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>

namespace clip_service {

// Persisted. path points at the compressed output from the moment the record
// is created, before the transcode has produced it.
struct VideoRecord {
  int64_t id{0};
  std::string path;
  std::optional<int64_t> route_id;  // parent record the clip is attached to
  bool completed{false};
  bool failed{false};
  std::chrono::system_clock::time_point created_at{};

  std::string debug() const {
    return std::format("id:{},path:{},route_id:{},completed:{},failed:{}",
      id, path, route_id ? std::to_string(*route_id) : "null", completed, failed);
  }
};

// Ephemeral, lives only in the JobRegistry.
struct Job {
  int64_t user_id{0};
  int64_t video_id{0};
  std::optional<int64_t> route_id;
  bool completed{false};
};

// Durable trace of a delivered completion notification. Append-only.
struct JobHistoryRecord {
  int64_t id{0};
  std::chrono::system_clock::time_point created_at{};
  int64_t user_id{0};
  int64_t video_id{0};
  std::optional<int64_t> route_id;
  bool completed{true};
};

// Work unit handed from the ingestor to the compression worker.
struct CompressionTask {
  std::string raw_path;
  std::string output_path;
  int64_t video_id{0};
};

#define COMPRESSED_FILE_EXTENSION ".mp4"

} // namespace clip_service
