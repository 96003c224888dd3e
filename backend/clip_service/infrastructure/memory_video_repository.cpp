#include "memory_video_repository.hpp"
#include <algorithm>
#include <iterator>

namespace clip_service {

std::expected<VideoRecord, std::string> MemoryVideoRepository::insert(const VideoRecord& video) {
  std::lock_guard<std::mutex> lock(mutex_);
  VideoRecord stored = video;
  stored.id = next_video_id_++;
  videos_[stored.id] = stored;
  return stored;
}

std::expected<VideoRecord, std::string> MemoryVideoRepository::findById(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = videos_.find(id);
  if (it == videos_.end()) {
    return std::unexpected("Video not found");
  }
  return it->second;
}

std::expected<VideoRecord, std::string> MemoryVideoRepository::findByPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(videos_.begin(), videos_.end(),
                         [&path](const auto& entry) { return entry.second.path == path; });
  if (it == videos_.end()) {
    return std::unexpected("Video not found");
  }
  return it->second;
}

std::expected<void, std::string> MemoryVideoRepository::update(const VideoRecord& video) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = videos_.find(video.id);
  if (it == videos_.end()) {
    return std::unexpected("Video not found");
  }
  it->second = video;
  return {};
}

std::expected<bool, std::string> MemoryVideoRepository::remove(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return videos_.erase(id) > 0;
}

std::expected<JobHistoryRecord, std::string> MemoryVideoRepository::append(const JobHistoryRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  JobHistoryRecord stored = record;
  stored.id = next_history_id_++;
  history_.push_back(stored);
  return stored;
}

std::expected<std::vector<JobHistoryRecord>, std::string> MemoryVideoRepository::findByUser(int64_t user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<JobHistoryRecord> records;
  std::copy_if(history_.begin(), history_.end(), std::back_inserter(records),
               [user_id](const JobHistoryRecord& r) { return r.user_id == user_id; });
  return records;
}

size_t MemoryVideoRepository::videoCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return videos_.size();
}

size_t MemoryVideoRepository::historyCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_.size();
}

} // namespace clip_service
