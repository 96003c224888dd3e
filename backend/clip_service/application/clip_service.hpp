#pragma once

#include "application/connection_manager.hpp"
#include "application/job_registry.hpp"
#include "application/notification_loop.hpp"
#include "application/upload_ingestor.hpp"
#include "domain/notification_channel.hpp"
#include "domain/video_repository.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/asio.hpp>

namespace clip_service {

// Entry points offered to the HTTP and websocket layers.
class ClipService {
public:
  ClipService(net::any_io_executor executor,
              std::shared_ptr<UploadIngestor> ingestor,
              std::shared_ptr<VideoRepository> videos,
              std::shared_ptr<JobHistoryRepository> history,
              std::shared_ptr<JobRegistry> registry,
              std::shared_ptr<ConnectionManager> connections,
              std::chrono::milliseconds tick_interval,
              std::shared_ptr<common::ThreadPool> history_pool = nullptr);

  std::expected<int64_t, std::string> ingest(int64_t user_id,
                                             std::optional<int64_t> route_id,
                                             std::string_view bytes,
                                             const std::string& suggested_name);

  // Makes channel the user's notification connection (evicting any previous
  // one) and starts its NotificationLoop. The loop and the registration are
  // torn down when the channel disconnects.
  std::shared_ptr<NotificationLoop> openNotificationChannel(int64_t user_id,
                                                            std::shared_ptr<NotificationChannel> channel);

  std::expected<VideoRecord, std::string> getVideo(int64_t video_id);
  std::expected<std::vector<JobHistoryRecord>, std::string> listJobHistory(int64_t user_id);

  void shutdown();

  const std::shared_ptr<JobRegistry>& registry() const { return registry_; }
  const std::shared_ptr<ConnectionManager>& connections() const { return connections_; }

private:
  net::any_io_executor executor_;
  std::shared_ptr<UploadIngestor> ingestor_;
  std::shared_ptr<VideoRepository> videos_;
  std::shared_ptr<JobHistoryRepository> history_;
  std::shared_ptr<JobRegistry> registry_;
  std::shared_ptr<ConnectionManager> connections_;
  std::chrono::milliseconds tick_interval_;
  std::shared_ptr<common::ThreadPool> history_pool_;
};

} // namespace clip_service
