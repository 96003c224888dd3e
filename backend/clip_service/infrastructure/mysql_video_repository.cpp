#include "mysql_video_repository.hpp"
#include "mysql_statement.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include <chrono>
#include <cstring>

namespace clip_service {

namespace {

const char* kCreateVideosTable =
  "CREATE TABLE IF NOT EXISTS videos ("
  "  id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
  "  path VARCHAR(1024) NOT NULL,"
  "  route_id BIGINT NULL,"
  "  completed TINYINT(1) NOT NULL DEFAULT 0,"
  "  failed TINYINT(1) NOT NULL DEFAULT 0,"
  "  created_at DATETIME(3) NOT NULL,"
  "  KEY idx_videos_path (path(255))"
  ")";

const char* kCreateJobHistoryTable =
  "CREATE TABLE IF NOT EXISTS job_history ("
  "  id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,"
  "  created_at DATETIME(3) NOT NULL,"
  "  user_id BIGINT NOT NULL,"
  "  video_id BIGINT NOT NULL,"
  "  route_id BIGINT NULL,"
  "  completed TINYINT(1) NOT NULL DEFAULT 1,"
  "  KEY idx_job_history_user (user_id)"
  ")";

const char* kVideoColumns =
  "SELECT id, path, route_id, completed, failed,"
  " CAST(UNIX_TIMESTAMP(created_at) * 1000 AS SIGNED) FROM videos ";

int64_t toMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromMillis(int64_t ms) {
  return std::chrono::system_clock::time_point{std::chrono::milliseconds(ms)};
}

// Result buffers for one row of kVideoColumns.
struct VideoRow {
  long long id{0};
  char path[1024];
  unsigned long path_length{0};
  long long route_id{0};
  mysql_flag route_is_null{0};
  long long completed{0};
  long long failed{0};
  long long created_ms{0};
  MYSQL_BIND result[6];

  VideoRow() {
    std::memset(result, 0, sizeof(result));

    result[0].buffer_type = MYSQL_TYPE_LONGLONG;
    result[0].buffer = &id;

    result[1].buffer_type = MYSQL_TYPE_STRING;
    result[1].buffer = path;
    result[1].buffer_length = sizeof(path);
    result[1].length = &path_length;

    result[2].buffer_type = MYSQL_TYPE_LONGLONG;
    result[2].buffer = &route_id;
    result[2].is_null = &route_is_null;

    result[3].buffer_type = MYSQL_TYPE_LONGLONG;
    result[3].buffer = &completed;

    result[4].buffer_type = MYSQL_TYPE_LONGLONG;
    result[4].buffer = &failed;

    result[5].buffer_type = MYSQL_TYPE_LONGLONG;
    result[5].buffer = &created_ms;
  }

  VideoRow(const VideoRow&) = delete;
  VideoRow& operator=(const VideoRow&) = delete;

  VideoRecord toRecord() const {
    VideoRecord video;
    video.id = id;
    video.path = std::string(path, path_length);
    if (!route_is_null) {
      video.route_id = route_id;
    }
    video.completed = completed != 0;
    video.failed = failed != 0;
    video.created_at = fromMillis(created_ms);
    return video;
  }
};

// Result buffers for one job_history row.
struct JobHistoryRow {
  long long id{0};
  long long created_ms{0};
  long long user_id{0};
  long long video_id{0};
  long long route_id{0};
  mysql_flag route_is_null{0};
  long long completed{0};
  MYSQL_BIND result[6];

  JobHistoryRow() {
    std::memset(result, 0, sizeof(result));
    long long* fields[] = {&id, &created_ms, &user_id, &video_id, &route_id, &completed};
    for (size_t i = 0; i < 6; ++i) {
      result[i].buffer_type = MYSQL_TYPE_LONGLONG;
      result[i].buffer = fields[i];
    }
    result[4].is_null = &route_is_null;
  }

  JobHistoryRow(const JobHistoryRow&) = delete;
  JobHistoryRow& operator=(const JobHistoryRow&) = delete;

  JobHistoryRecord toRecord() const {
    JobHistoryRecord record;
    record.id = id;
    record.created_at = fromMillis(created_ms);
    record.user_id = user_id;
    record.video_id = video_id;
    if (!route_is_null) {
      record.route_id = route_id;
    }
    record.completed = completed != 0;
    return record;
  }
};

} // namespace

MysqlVideoRepository::MysqlVideoRepository() = default;

MysqlVideoRepository::~MysqlVideoRepository() = default;

std::expected<void, std::string> MysqlVideoRepository::ensureSchema() {
  try {
    common::MySQLConnectionGuard conn_guard(common::MySQLConnectionPool::getInstance());
    for (const char* ddl : {kCreateVideosTable, kCreateJobHistoryTable}) {
      if (mysql_query(conn_guard.get(), ddl)) {
        return std::unexpected(mysql_error(conn_guard.get()));
      }
    }
    return {};
  } catch (const std::exception& e) {
    return std::unexpected(std::string(e.what()));
  }
}

std::expected<VideoRecord, std::string> MysqlVideoRepository::insert(const VideoRecord& video) {
  const char* query = "INSERT INTO videos (path, route_id, completed, failed, created_at) "
                      "VALUES (?, ?, ?, ?, FROM_UNIXTIME(? / 1000))";
  try {
    common::MySQLConnectionGuard conn_guard(common::MySQLConnectionPool::getInstance());

    MysqlBindHelper bind_helper(5);
    bind_helper.bind_string(0, video.path);
    bind_helper.bind_optional_long(1, video.route_id);
    bind_helper.bind_bool(2, video.completed);
    bind_helper.bind_bool(3, video.failed);
    bind_helper.bind_long(4, toMillis(video.created_at));

    MysqlStatement stmt(conn_guard.get());
    if (auto executed = stmt.execute(query, bind_helper.data()); !executed) {
      return std::unexpected(executed.error());
    }

    VideoRecord stored = video;
    stored.id = stmt.insertId();
    return stored;
  } catch (const std::exception& e) {
    return std::unexpected(std::string(e.what()));
  }
}

std::expected<VideoRecord, std::string> MysqlVideoRepository::selectOne(const char* query, MYSQL_BIND* params) {
  try {
    common::MySQLConnectionGuard conn_guard(common::MySQLConnectionPool::getInstance());

    MysqlStatement stmt(conn_guard.get());
    if (auto executed = stmt.execute(query, params); !executed) {
      return std::unexpected(executed.error());
    }

    VideoRow row;
    if (mysql_stmt_bind_result(stmt.get(), row.result)) {
      return std::unexpected(stmt.error());
    }

    switch (mysql_stmt_fetch(stmt.get())) {
      case 0:
        return row.toRecord();
      case MYSQL_NO_DATA:
        return std::unexpected("Video not found");
      case MYSQL_DATA_TRUNCATED:
        return std::unexpected("Video path longer than " + std::to_string(sizeof(row.path)) + " bytes");
      default:
        return std::unexpected(stmt.error());
    }
  } catch (const std::exception& e) {
    return std::unexpected(std::string(e.what()));
  }
}

std::expected<VideoRecord, std::string> MysqlVideoRepository::findById(int64_t id) {
  const std::string query = std::string(kVideoColumns) + "WHERE id = ?";
  MysqlBindHelper bind_helper(1);
  bind_helper.bind_long(0, id);
  return selectOne(query.c_str(), bind_helper.data());
}

std::expected<VideoRecord, std::string> MysqlVideoRepository::findByPath(const std::string& path) {
  const std::string query = std::string(kVideoColumns) + "WHERE path = ? ORDER BY id LIMIT 1";
  MysqlBindHelper bind_helper(1);
  bind_helper.bind_string(0, path);
  return selectOne(query.c_str(), bind_helper.data());
}

std::expected<void, std::string> MysqlVideoRepository::update(const VideoRecord& video) {
  const char* query = "UPDATE videos SET path = ?, route_id = ?, completed = ?, failed = ? WHERE id = ?";
  try {
    common::MySQLConnectionGuard conn_guard(common::MySQLConnectionPool::getInstance());

    MysqlBindHelper bind_helper(5);
    bind_helper.bind_string(0, video.path);
    bind_helper.bind_optional_long(1, video.route_id);
    bind_helper.bind_bool(2, video.completed);
    bind_helper.bind_bool(3, video.failed);
    bind_helper.bind_long(4, video.id);

    MysqlStatement stmt(conn_guard.get());
    if (auto executed = stmt.execute(query, bind_helper.data()); !executed) {
      return std::unexpected(executed.error());
    }
    return {};
  } catch (const std::exception& e) {
    return std::unexpected(std::string(e.what()));
  }
}

std::expected<bool, std::string> MysqlVideoRepository::remove(int64_t id) {
  const char* query = "DELETE FROM videos WHERE id = ?";
  try {
    common::MySQLConnectionGuard conn_guard(common::MySQLConnectionPool::getInstance());

    MysqlBindHelper bind_helper(1);
    bind_helper.bind_long(0, id);

    MysqlStatement stmt(conn_guard.get());
    if (auto executed = stmt.execute(query, bind_helper.data()); !executed) {
      return std::unexpected(executed.error());
    }
    return stmt.affectedRows() > 0;
  } catch (const std::exception& e) {
    return std::unexpected(std::string(e.what()));
  }
}

std::expected<JobHistoryRecord, std::string> MysqlVideoRepository::append(const JobHistoryRecord& record) {
  const char* query = "INSERT INTO job_history (created_at, user_id, video_id, route_id, completed) "
                      "VALUES (FROM_UNIXTIME(? / 1000), ?, ?, ?, ?)";
  try {
    common::MySQLConnectionGuard conn_guard(common::MySQLConnectionPool::getInstance());

    MysqlBindHelper bind_helper(5);
    bind_helper.bind_long(0, toMillis(record.created_at));
    bind_helper.bind_long(1, record.user_id);
    bind_helper.bind_long(2, record.video_id);
    bind_helper.bind_optional_long(3, record.route_id);
    bind_helper.bind_bool(4, record.completed);

    MysqlStatement stmt(conn_guard.get());
    if (auto executed = stmt.execute(query, bind_helper.data()); !executed) {
      return std::unexpected(executed.error());
    }

    JobHistoryRecord stored = record;
    stored.id = stmt.insertId();
    return stored;
  } catch (const std::exception& e) {
    return std::unexpected(std::string(e.what()));
  }
}

std::expected<std::vector<JobHistoryRecord>, std::string> MysqlVideoRepository::findByUser(int64_t user_id) {
  const char* query = "SELECT id, CAST(UNIX_TIMESTAMP(created_at) * 1000 AS SIGNED), user_id, video_id,"
                      " route_id, completed FROM job_history WHERE user_id = ? ORDER BY id";
  try {
    common::MySQLConnectionGuard conn_guard(common::MySQLConnectionPool::getInstance());

    MysqlBindHelper bind_helper(1);
    bind_helper.bind_long(0, user_id);

    MysqlStatement stmt(conn_guard.get());
    if (auto executed = stmt.execute(query, bind_helper.data()); !executed) {
      return std::unexpected(executed.error());
    }

    JobHistoryRow row;
    if (mysql_stmt_bind_result(stmt.get(), row.result)) {
      return std::unexpected(stmt.error());
    }

    std::vector<JobHistoryRecord> records;
    while (true) {
      int rc = mysql_stmt_fetch(stmt.get());
      if (rc == MYSQL_NO_DATA) {
        break;
      }
      if (rc != 0) {
        return std::unexpected(stmt.error());
      }
      records.push_back(row.toRecord());
    }
    return records;
  } catch (const std::exception& e) {
    return std::unexpected(std::string(e.what()));
  }
}

} // namespace clip_service
