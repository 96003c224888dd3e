#pragma once

#include "domain/video.hpp"
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clip_service {

// In-memory table of in-flight jobs, one per video id. Every operation takes
// the registry lock, so a scan and the removal that follows it are a single
// step: a job handed out by takeCompleted() is gone for every other caller.
class JobRegistry {
public:
  JobRegistry() = default;
  JobRegistry(const JobRegistry&) = delete;
  JobRegistry& operator=(const JobRegistry&) = delete;

  // Fails if a job for the same video is already registered.
  std::expected<void, std::string> add(const Job& job);

  // false when no job exists for the video
  bool markCompleted(int64_t video_id);

  // Drops the job without it ever being delivered.
  bool discard(int64_t video_id);

  // Removes and returns every completed job owned by user_id.
  std::vector<Job> takeCompleted(int64_t user_id);

  // Puts back jobs whose delivery failed after takeCompleted().
  void restore(const std::vector<Job>& jobs);

  std::optional<Job> find(int64_t video_id) const;
  std::vector<Job> snapshot() const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<int64_t, Job> jobs_;
};

} // namespace clip_service
