#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

#include "common/config/config.hpp"

namespace common {

// RAII: one live backend connection, closed on destruction
class Connection {
public:
  Connection() = default;
  virtual ~Connection() = default;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // round trip to the server
  virtual bool isValid() const = 0;
};

/*
  parked   = connections waiting in idle_, most recently returned at the back
  borrowed = connections currently checked out through a ConnectionGuard
  parked + borrowed <= max_connections

  Parked connections are kept up to min_connections. One that has been parked
  longer than idle_timeout is closed instead of reused, the others are pinged
  before they are handed out.
*/
class ConnectionPool {
public:
  struct Stats {
    size_t parked;
    size_t borrowed;
    size_t created;
    size_t discarded;
  };

  virtual ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Throws std::runtime_error on timeout, after shutdown(), or when a new
  // connection can't be opened. Never returns null.
  std::unique_ptr<Connection> acquire();
  void release(std::unique_ptr<Connection> conn);

  // Closes the parked connections; every later acquire() throws.
  void shutdown();

  Stats stats() const;

protected:
  explicit ConnectionPool(const config::ConnectionPoolConfig& cfg) : config_(cfg) {}

  // nullptr when the backend refuses the connection
  virtual std::unique_ptr<Connection> createConnection() = 0;

  // Opens min_connections up front. Derived constructors call it once
  // createConnection() is usable.
  void prefill();

  const config::ConnectionPoolConfig& poolConfig() const { return config_; }

private:
  struct Parked {
    std::unique_ptr<Connection> conn;
    std::chrono::steady_clock::time_point since;
  };

  config::ConnectionPoolConfig config_;
  std::deque<Parked> idle_;
  size_t borrowed_{0};
  size_t created_{0};
  size_t discarded_{0};
  bool shutdown_{false};

  mutable std::mutex mutex_;
  std::condition_variable released_;
};

// RAII: borrow a connection for the guard's scope, hand it back on destruction
class ConnectionGuard {
public:
  explicit ConnectionGuard(ConnectionPool& pool) : pool_(pool), conn_(pool.acquire()) {}
  ~ConnectionGuard() { pool_.release(std::move(conn_)); }

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

protected:
  ConnectionPool& pool_;
  std::unique_ptr<Connection> conn_;
};

} // namespace common
