#include "connection_manager.hpp"
#include <iostream>

namespace clip_service {

std::shared_ptr<ActiveConnection> ConnectionManager::registerConnection(
    int64_t user_id, std::shared_ptr<NotificationChannel> channel, std::shared_ptr<NotificationLoop> loop) {
  auto connection = std::make_shared<ActiveConnection>(ActiveConnection{
    .user_id = user_id,
    .channel = std::move(channel),
    .loop = std::move(loop),
    .connected_at = std::chrono::steady_clock::now()
  });

  std::shared_ptr<ActiveConnection> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = connections_[user_id];
    evicted = std::move(slot);
    slot = connection;
  }

  // closing may re-enter unregisterConnection through the disconnect handler
  if (evicted) {
    std::cout << "[ConnectionManager] evicting previous connection of user " << user_id << std::endl;
    shutdownConnection(*evicted);
  }
  return connection;
}

void ConnectionManager::shutdownConnection(ActiveConnection& connection) {
  // the old loop must not take jobs it can no longer deliver
  if (connection.loop) {
    connection.loop->stop();
  }
  if (connection.channel) {
    connection.channel->close();
  }
}

bool ConnectionManager::unregisterConnection(const std::shared_ptr<ActiveConnection>& connection) {
  if (!connection) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection->user_id);
  if (it == connections_.end() || it->second != connection) {
    return false;
  }
  connections_.erase(it);
  return true;
}

std::shared_ptr<ActiveConnection> ConnectionManager::find(int64_t user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(user_id);
  return it == connections_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<ActiveConnection>> ConnectionManager::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<ActiveConnection>> result;
  result.reserve(connections_.size());
  for (const auto& [_, connection] : connections_) {
    result.push_back(connection);
  }
  return result;
}

size_t ConnectionManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

void ConnectionManager::closeAll() {
  std::unordered_map<int64_t, std::shared_ptr<ActiveConnection>> closing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closing.swap(connections_);
  }
  for (auto& [_, connection] : closing) {
    shutdownConnection(*connection);
  }
}

} // namespace clip_service
