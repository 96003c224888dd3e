#include "connection_pool.hpp"
#include <stdexcept>

namespace common {

ConnectionPool::~ConnectionPool() {
  shutdown();
}

void ConnectionPool::prefill() {
  std::lock_guard<std::mutex> lock(mutex_);
  while (idle_.size() < config_.min_connections) {
    auto conn = createConnection();
    if (!conn) {
      break;
    }
    ++created_;
    idle_.push_back(Parked{std::move(conn), std::chrono::steady_clock::now()});
  }
}

std::unique_ptr<Connection> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  const auto deadline = std::chrono::steady_clock::now() + config_.timeout;

  while (true) {
    if (shutdown_) {
      throw std::runtime_error("Connection pool is shut down");
    }

    while (!idle_.empty()) {
      Parked parked = std::move(idle_.back());
      idle_.pop_back();

      if (std::chrono::steady_clock::now() - parked.since > config_.idle_timeout) {
        ++discarded_;
        continue;
      }

      // the ping goes over the network, so it runs without the lock while the
      // slot is already counted as borrowed
      ++borrowed_;
      lock.unlock();
      if (parked.conn->isValid()) {
        return std::move(parked.conn);
      }
      parked.conn.reset();
      lock.lock();
      --borrowed_;
      ++discarded_;
    }

    if (borrowed_ < config_.max_connections) {
      ++borrowed_;
      lock.unlock();
      auto conn = createConnection();
      lock.lock();

      if (!conn) {
        --borrowed_;
        released_.notify_one();
        throw std::runtime_error("Failed to create database connection");
      }
      ++created_;
      return conn;
    }

    if (released_.wait_until(lock, deadline) == std::cv_status::timeout) {
      throw std::runtime_error("Connection pool timeout");
    }
  }
}

void ConnectionPool::release(std::unique_ptr<Connection> conn) {
  if (!conn) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  --borrowed_;
  if (shutdown_ || idle_.size() >= config_.min_connections) {
    ++discarded_;
    conn.reset();
  } else {
    idle_.push_back(Parked{std::move(conn), std::chrono::steady_clock::now()});
  }
  released_.notify_one();
}

void ConnectionPool::shutdown() {
  std::deque<Parked> closing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    closing.swap(idle_);
  }
  released_.notify_all();
}

ConnectionPool::Stats ConnectionPool::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Stats{idle_.size(), borrowed_, created_, discarded_};
}

} // namespace common
