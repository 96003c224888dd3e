#pragma once

#include "application/notification_loop.hpp"
#include "domain/notification_channel.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace clip_service {

struct ActiveConnection {
  int64_t user_id{0};
  std::shared_ptr<NotificationChannel> channel;
  // stopped before the channel is closed on eviction and shutdown
  std::shared_ptr<NotificationLoop> loop;
  std::chrono::steady_clock::time_point connected_at;
};

// Holds at most one live notification channel per user.
class ConnectionManager {
public:
  ConnectionManager() = default;
  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Installs channel as the user's connection. A previous connection for the
  // same user is removed, its loop stopped, and then its channel closed.
  std::shared_ptr<ActiveConnection> registerConnection(int64_t user_id,
                                                       std::shared_ptr<NotificationChannel> channel,
                                                       std::shared_ptr<NotificationLoop> loop = nullptr);

  // Removes exactly this connection. Safe to call repeatedly, and a no-op once
  // the connection has been replaced by a newer one. Returns whether it removed anything.
  bool unregisterConnection(const std::shared_ptr<ActiveConnection>& connection);

  std::shared_ptr<ActiveConnection> find(int64_t user_id) const;
  std::vector<std::shared_ptr<ActiveConnection>> snapshot() const;
  size_t size() const;

  // Closes and forgets every connection (shutdown).
  void closeAll();

private:
  static void shutdownConnection(ActiveConnection& connection);

  mutable std::mutex mutex_;
  std::unordered_map<int64_t, std::shared_ptr<ActiveConnection>> connections_;
};

} // namespace clip_service
