#pragma once

// project
#include "video.hpp"

// std
#include <cstdint>
#include <string>
#include <expected>
#include <vector>

namespace clip_service {

class VideoRepository {
public:
  virtual ~VideoRepository() = default;
  // Assigns the id and returns the stored record.
  virtual std::expected<VideoRecord, std::string> insert(const VideoRecord& video) = 0;
  virtual std::expected<VideoRecord, std::string> findById(int64_t id) = 0;
  virtual std::expected<VideoRecord, std::string> findByPath(const std::string& path) = 0;
  virtual std::expected<void, std::string> update(const VideoRecord& video) = 0;
  // Only used to roll back a record created by a failed ingest.
  virtual std::expected<bool, std::string> remove(int64_t id) = 0;
};

class JobHistoryRepository {
public:
  virtual ~JobHistoryRepository() = default;
  virtual std::expected<JobHistoryRecord, std::string> append(const JobHistoryRecord& record) = 0;
  virtual std::expected<std::vector<JobHistoryRecord>, std::string> findByUser(int64_t user_id) = 0;
};

} // namespace clip_service
