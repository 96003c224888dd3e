#pragma once
#include <mysql/mysql.h>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clip_service {

// my_bool on MariaDB, bool on MySQL 8
using mysql_flag = decltype(std::declval<MYSQL_BIND>().is_null_value);

// RAII wrapper for MySQL bind parameters
class MysqlBindHelper {
public:
  MysqlBindHelper(size_t param_count)
    : binds_(param_count), string_storage_(param_count), long_storage_(param_count),
      null_storage_(new mysql_flag[param_count]()) {
    std::memset(binds_.data(), 0, sizeof(MYSQL_BIND) * param_count);
  }

  void bind_string(size_t pos, const std::string& str) {
    if (pos >= binds_.size()) return;

    string_storage_[pos] = str;

    binds_[pos].buffer_type = MYSQL_TYPE_STRING;
    binds_[pos].buffer = const_cast<char*>(string_storage_[pos].c_str());
    binds_[pos].buffer_length = string_storage_[pos].length();
  }

  void bind_long(size_t pos, int64_t value) {
    if (pos >= binds_.size()) return;

    long_storage_[pos] = value;

    binds_[pos].buffer_type = MYSQL_TYPE_LONGLONG;
    binds_[pos].buffer = &long_storage_[pos];
    binds_[pos].is_unsigned = 0;
  }

  void bind_optional_long(size_t pos, std::optional<int64_t> value) {
    if (pos >= binds_.size()) return;

    bind_long(pos, value.value_or(0));
    null_storage_[pos] = value ? 0 : 1;
    binds_[pos].is_null = &null_storage_[pos];
  }

  void bind_bool(size_t pos, bool value) { bind_long(pos, value ? 1 : 0); }

  MYSQL_BIND* data() { return binds_.data(); }

private:
  std::vector<MYSQL_BIND> binds_;
  std::vector<std::string> string_storage_;
  std::vector<long long> long_storage_;
  std::unique_ptr<mysql_flag[]> null_storage_;
};

// RAII: owns one prepared statement, mysql_stmt_close on destruction
class MysqlStatement {
public:
  explicit MysqlStatement(MYSQL* conn) : conn_(conn), stmt_(mysql_stmt_init(conn)) {}
  ~MysqlStatement() { if (stmt_) mysql_stmt_close(stmt_); }

  MysqlStatement(const MysqlStatement&) = delete;
  MysqlStatement& operator=(const MysqlStatement&) = delete;

  // prepare + bind + execute
  std::expected<void, std::string> execute(std::string_view query, MYSQL_BIND* params) {
    if (!stmt_) {
      return std::unexpected(std::string("mysql_stmt_init failed: ") + mysql_error(conn_));
    }
    if (mysql_stmt_prepare(stmt_, query.data(), query.size())) {
      return std::unexpected(error());
    }
    if (params && mysql_stmt_bind_param(stmt_, params)) {
      return std::unexpected(error());
    }
    if (mysql_stmt_execute(stmt_)) {
      return std::unexpected(error());
    }
    return {};
  }

  MYSQL_STMT* get() const { return stmt_; }
  int64_t insertId() const { return static_cast<int64_t>(mysql_stmt_insert_id(stmt_)); }
  int64_t affectedRows() const { return static_cast<int64_t>(mysql_stmt_affected_rows(stmt_)); }
  std::string error() const { return stmt_ ? mysql_stmt_error(stmt_) : mysql_error(conn_); }

private:
  MYSQL* conn_;
  MYSQL_STMT* stmt_;
};

} // namespace clip_service
