#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <mysql/mysql.h>
#include <memory>

namespace common {

// RAII: owns one MYSQL handle, mysql_close on destruction
class MySQLConnection : public Connection {
public:
  explicit MySQLConnection(MYSQL* conn) : conn_(conn) {}
  ~MySQLConnection() override { mysql_close(conn_); }

  MYSQL* get() const { return conn_; }
  bool isValid() const override { return mysql_ping(conn_) == 0; }

private:
  MYSQL* conn_;
};

// Process-wide pool configured from config::Config (database + db_pool).
// Built on first use, so a memory-backed server never connects.
class MySQLConnectionPool final : public ConnectionPool {
public:
  static MySQLConnectionPool& getInstance() {
    static MySQLConnectionPool instance;
    return instance;
  }

protected:
  std::unique_ptr<Connection> createConnection() override;

private:
  MySQLConnectionPool();
  config::DatabaseConfig db_config_;
};

class MySQLConnectionGuard final : public ConnectionGuard {
public:
  using ConnectionGuard::ConnectionGuard;

  MYSQL* get() const {
    return static_cast<MySQLConnection*>(conn_.get())->get();
  }
};

} // namespace common
