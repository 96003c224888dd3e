#pragma once
#include "domain/video_repository.hpp"
#include <mysql/mysql.h>
#include <memory>

namespace clip_service {

// videos and job_history tables, reached through common::MySQLConnectionPool.
class MysqlVideoRepository : public VideoRepository, public JobHistoryRepository {
public:
  MysqlVideoRepository();
  ~MysqlVideoRepository();

  // CREATE TABLE IF NOT EXISTS for both tables
  std::expected<void, std::string> ensureSchema();

  std::expected<VideoRecord, std::string> insert(const VideoRecord& video) override;
  std::expected<VideoRecord, std::string> findById(int64_t id) override;
  std::expected<VideoRecord, std::string> findByPath(const std::string& path) override;
  std::expected<void, std::string> update(const VideoRecord& video) override;
  std::expected<bool, std::string> remove(int64_t id) override;

  std::expected<JobHistoryRecord, std::string> append(const JobHistoryRecord& record) override;
  std::expected<std::vector<JobHistoryRecord>, std::string> findByUser(int64_t user_id) override;

private:
  // runs a single-row SELECT over the videos columns with one bound parameter
  std::expected<VideoRecord, std::string> selectOne(const char* query, MYSQL_BIND* params);
};
}
