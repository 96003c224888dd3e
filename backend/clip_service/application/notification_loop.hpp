#pragma once

#include "application/job_registry.hpp"
#include "common/thread_pool.hpp"
#include "domain/notification_channel.hpp"
#include "domain/video_repository.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <boost/asio.hpp>

namespace net = boost::asio;

namespace clip_service {

// Per-connection poller. Every tick it takes the user's completed jobs out of
// the registry, pushes one message per job over the channel and records a
// JobHistoryRecord for each delivered message.
//
//   Connected --tick--> Connected ... --disconnect/stop--> Disconnected
//
// Disconnected is terminal. Jobs that never completed stay in the registry.
class NotificationLoop : public std::enable_shared_from_this<NotificationLoop> {
public:
  enum class State { Connected, Disconnected };

  NotificationLoop(net::any_io_executor executor,
                   int64_t user_id,
                   std::shared_ptr<NotificationChannel> channel,
                   std::shared_ptr<JobRegistry> registry,
                   std::shared_ptr<JobHistoryRepository> history,
                   std::chrono::milliseconds interval,
                   std::shared_ptr<common::ThreadPool> history_pool = nullptr);

  void start();
  // Cancels the pending tick. Idempotent, never throws.
  void stop() noexcept;

  // One scan; returns the number of jobs delivered.
  size_t tick();

  State state() const { return state_.load(std::memory_order_acquire); }
  int64_t userId() const { return user_id_; }
  size_t delivered() const { return delivered_.load(std::memory_order_relaxed); }

  static std::string completionMessage(const Job& job);

private:
  void scheduleTick();
  void onTick(boost::system::error_code ec);
  // Appends on history_pool_ when there is one, inline otherwise.
  void recordHistory(JobHistoryRecord record);

  net::strand<net::any_io_executor> strand_;
  net::steady_timer timer_;
  int64_t user_id_;
  std::shared_ptr<NotificationChannel> channel_;
  std::shared_ptr<JobRegistry> registry_;
  std::shared_ptr<JobHistoryRepository> history_;
  std::chrono::milliseconds interval_;
  // repository writes block (libmysqlclient), keep them off the io threads
  std::shared_ptr<common::ThreadPool> history_pool_;
  std::atomic<State> state_{State::Connected};
  std::atomic<size_t> delivered_{0};
};

} // namespace clip_service
