#pragma once
#include "domain/video_repository.hpp"
#include <map>
#include <mutex>
#include <vector>

namespace clip_service {

// Process-local store for both record kinds, used by the tests and by
// database.backend = "memory". Ids start at 1 like an auto-increment column.
class MemoryVideoRepository final : public VideoRepository, public JobHistoryRepository {
public:
  MemoryVideoRepository() = default;

  std::expected<VideoRecord, std::string> insert(const VideoRecord& video) override;
  std::expected<VideoRecord, std::string> findById(int64_t id) override;
  std::expected<VideoRecord, std::string> findByPath(const std::string& path) override;
  std::expected<void, std::string> update(const VideoRecord& video) override;
  std::expected<bool, std::string> remove(int64_t id) override;

  std::expected<JobHistoryRecord, std::string> append(const JobHistoryRecord& record) override;
  std::expected<std::vector<JobHistoryRecord>, std::string> findByUser(int64_t user_id) override;

  size_t videoCount() const;
  size_t historyCount() const;

private:
  mutable std::mutex mutex_;
  std::map<int64_t, VideoRecord> videos_;
  std::vector<JobHistoryRecord> history_;
  int64_t next_video_id_{1};
  int64_t next_history_id_{1};
};

} // namespace clip_service
