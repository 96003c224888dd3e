#include "mysql_connection_pool.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace common {

MySQLConnectionPool::MySQLConnectionPool()
  : ConnectionPool(config::Config::getInstance().getDBCntPool()),
    db_config_(config::Config::getInstance().getDatabase()) {
  prefill();
  std::cout << "[MySQLConnectionPool] " << stats().parked << " connections to "
            << db_config_.host << ":" << db_config_.port << "/" << db_config_.db_name << std::endl;
}

std::unique_ptr<Connection> MySQLConnectionPool::createConnection() {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    std::cerr << "[MySQLConnectionPool] mysql_init failed" << std::endl;
    return nullptr;
  }

  mysql_options(conn, MYSQL_SET_CHARSET_NAME, db_config_.charset.c_str());

  const auto timeout_s = std::chrono::duration_cast<std::chrono::seconds>(poolConfig().timeout);
  unsigned int connect_timeout = std::max<unsigned int>(1, static_cast<unsigned int>(timeout_s.count()));
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout);

  if (!mysql_real_connect(conn, db_config_.host.c_str(), db_config_.user.c_str(),
                          db_config_.password.c_str(), db_config_.db_name.c_str(),
                          db_config_.port, nullptr, 0)) {
    std::cerr << "[MySQLConnectionPool] connect to " << db_config_.host << ":" << db_config_.port
              << " failed: " << mysql_error(conn) << std::endl;
    mysql_close(conn);
    return nullptr;
  }

  return std::make_unique<MySQLConnection>(conn);
}

} // namespace common
