#include "notification_loop.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace clip_service {

NotificationLoop::NotificationLoop(net::any_io_executor executor,
                                   int64_t user_id,
                                   std::shared_ptr<NotificationChannel> channel,
                                   std::shared_ptr<JobRegistry> registry,
                                   std::shared_ptr<JobHistoryRepository> history,
                                   std::chrono::milliseconds interval,
                                   std::shared_ptr<common::ThreadPool> history_pool)
  : strand_(net::make_strand(executor)),
    timer_(strand_),
    user_id_(user_id),
    channel_(std::move(channel)),
    registry_(std::move(registry)),
    history_(std::move(history)),
    interval_(interval),
    history_pool_(std::move(history_pool)) {}

void NotificationLoop::start() {
  net::dispatch(strand_, [self = shared_from_this()]() {
    self->scheduleTick();
  });
}

void NotificationLoop::stop() noexcept {
  if (state_.exchange(State::Disconnected) == State::Disconnected) {
    return;
  }
  try {
    net::post(strand_, [self = shared_from_this()]() {
      self->timer_.cancel();
    });
  } catch (const std::exception& e) {
    // only reachable when the loop isn't owned by a shared_ptr
    std::cerr << "[NotificationLoop] stop: " << e.what() << std::endl;
  }
}

void NotificationLoop::scheduleTick() {
  if (state() == State::Disconnected) {
    return;
  }
  timer_.expires_after(interval_);
  timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
    self->onTick(ec);
  });
}

void NotificationLoop::onTick(boost::system::error_code ec) {
  if (ec == net::error::operation_aborted || state() == State::Disconnected) {
    return;
  }
  tick();
  scheduleTick();
}

size_t NotificationLoop::tick() {
  if (state() == State::Disconnected) {
    return 0;
  }
  if (!channel_->isOpen()) {
    state_.store(State::Disconnected, std::memory_order_release);
    return 0;
  }

  auto jobs = registry_->takeCompleted(user_id_);
  size_t sent = 0;

  for (size_t i = 0; i < jobs.size(); ++i) {
    const auto& job = jobs[i];

    if (state() == State::Disconnected) {
      // stopped mid-tick (evicted): the replacement connection gets the rest
      registry_->restore(std::vector<Job>(jobs.begin() + i, jobs.end()));
      break;
    }

    if (auto result = channel_->send(completionMessage(job)); !result) {
      std::cerr << "[NotificationLoop] user " << user_id_ << ": send failed for video "
                << job.video_id << ": " << result.error() << std::endl;
      // hand the undelivered ones back for the next connection of this user
      registry_->restore(std::vector<Job>(jobs.begin() + i, jobs.end()));
      state_.store(State::Disconnected, std::memory_order_release);
      break;
    }

    JobHistoryRecord record{
      .created_at = std::chrono::system_clock::now(),
      .user_id = job.user_id,
      .video_id = job.video_id,
      .route_id = job.route_id,
      .completed = true
    };
    recordHistory(record);

    std::cout << "[NotificationLoop] user " << user_id_ << ": notified video " << job.video_id << std::endl;
    ++sent;
  }

  delivered_.fetch_add(sent, std::memory_order_relaxed);
  return sent;
}

void NotificationLoop::recordHistory(JobHistoryRecord record) {
  // the message is already out, so a failed write is logged rather than retried
  auto append = [history = history_, user_id = user_id_](const JobHistoryRecord& entry) {
    if (auto stored = history->append(entry); !stored) {
      std::cerr << "[NotificationLoop] user " << user_id << ": job history for video "
                << entry.video_id << " not persisted: " << stored.error() << std::endl;
    }
  };

  if (history_pool_) {
    try {
      history_pool_->commit([append, record]() { append(record); });
      return;
    } catch (const std::exception& e) {
      // pool already shut down
      std::cerr << "[NotificationLoop] user " << user_id_ << ": " << e.what()
                << ", writing job history inline" << std::endl;
    }
  }
  append(record);
}

std::string NotificationLoop::completionMessage(const Job& job) {
  nlohmann::json message = {
    {"event", "transcode_completed"},
    {"video_id", job.video_id},
    {"route_id", nullptr}
  };
  if (job.route_id) {
    message["route_id"] = *job.route_id;
  }
  return message.dump();
}

} // namespace clip_service
