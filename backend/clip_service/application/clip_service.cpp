#include "clip_service.hpp"
#include <iostream>

namespace clip_service {

ClipService::ClipService(net::any_io_executor executor,
                         std::shared_ptr<UploadIngestor> ingestor,
                         std::shared_ptr<VideoRepository> videos,
                         std::shared_ptr<JobHistoryRepository> history,
                         std::shared_ptr<JobRegistry> registry,
                         std::shared_ptr<ConnectionManager> connections,
                         std::chrono::milliseconds tick_interval,
                         std::shared_ptr<common::ThreadPool> history_pool)
  : executor_(std::move(executor)),
    ingestor_(std::move(ingestor)),
    videos_(std::move(videos)),
    history_(std::move(history)),
    registry_(std::move(registry)),
    connections_(std::move(connections)),
    tick_interval_(tick_interval),
    history_pool_(std::move(history_pool)) {}

std::expected<int64_t, std::string> ClipService::ingest(int64_t user_id,
                                                        std::optional<int64_t> route_id,
                                                        std::string_view bytes,
                                                        const std::string& suggested_name) {
  return ingestor_->ingest(user_id, route_id, bytes, suggested_name);
}

std::shared_ptr<NotificationLoop> ClipService::openNotificationChannel(
    int64_t user_id, std::shared_ptr<NotificationChannel> channel) {
  auto loop = std::make_shared<NotificationLoop>(
    executor_, user_id, channel, registry_, history_, tick_interval_, history_pool_);
  // stops the evicted connection's loop before its channel is closed
  auto connection = connections_->registerConnection(user_id, channel, loop);

  std::weak_ptr<ConnectionManager> weak_connections = connections_;
  channel->onDisconnect([loop, connection, weak_connections]() {
    loop->stop();
    if (auto connections = weak_connections.lock()) {
      connections->unregisterConnection(connection);
    }
    std::cout << "[ClipService] user " << connection->user_id << ": notification channel closed" << std::endl;
  });

  // the channel may already be gone, in which case the handler above has run
  if (loop->state() == NotificationLoop::State::Connected) {
    loop->start();
    std::cout << "[ClipService] user " << user_id << ": notification channel open" << std::endl;
  }
  return loop;
}

std::expected<VideoRecord, std::string> ClipService::getVideo(int64_t video_id) {
  return videos_->findById(video_id);
}

std::expected<std::vector<JobHistoryRecord>, std::string> ClipService::listJobHistory(int64_t user_id) {
  return history_->findByUser(user_id);
}

void ClipService::shutdown() {
  connections_->closeAll();
}

} // namespace clip_service
