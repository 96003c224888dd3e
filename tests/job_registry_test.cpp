#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "application/job_registry.hpp"

namespace clip_service {
namespace {

TEST(JobRegistryTest, AddRejectsSecondJobForSameVideo) {
  JobRegistry registry;
  ASSERT_TRUE(registry.add(Job{1, 42, 7, false}));
  auto again = registry.add(Job{2, 42, std::nullopt, false});
  EXPECT_FALSE(again);
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.find(42)->user_id, 1);
}

TEST(JobRegistryTest, TakeCompletedReturnsOnlyCompletedJobsOfThatUser) {
  JobRegistry registry;
  ASSERT_TRUE(registry.add(Job{1, 10, std::nullopt, false}));
  ASSERT_TRUE(registry.add(Job{1, 11, 7, false}));
  ASSERT_TRUE(registry.add(Job{2, 12, std::nullopt, false}));

  EXPECT_TRUE(registry.markCompleted(11));
  EXPECT_TRUE(registry.markCompleted(12));

  auto taken = registry.takeCompleted(1);
  ASSERT_EQ(taken.size(), 1u);
  EXPECT_EQ(taken[0].video_id, 11);
  EXPECT_EQ(taken[0].route_id, 7);
  EXPECT_TRUE(taken[0].completed);

  // taken jobs are gone, the rest stay
  EXPECT_FALSE(registry.find(11));
  EXPECT_TRUE(registry.find(10));
  EXPECT_TRUE(registry.find(12));
  EXPECT_TRUE(registry.takeCompleted(1).empty());
}

TEST(JobRegistryTest, MarkCompletedAndDiscardOnUnknownVideo) {
  JobRegistry registry;
  EXPECT_FALSE(registry.markCompleted(99));
  EXPECT_FALSE(registry.discard(99));
}

TEST(JobRegistryTest, DiscardedJobIsNeverTaken) {
  JobRegistry registry;
  ASSERT_TRUE(registry.add(Job{3, 5, std::nullopt, false}));
  EXPECT_TRUE(registry.discard(5));
  EXPECT_FALSE(registry.markCompleted(5));
  EXPECT_TRUE(registry.takeCompleted(3).empty());
  EXPECT_EQ(registry.size(), 0u);
}

TEST(JobRegistryTest, RestorePutsUndeliveredJobsBack) {
  JobRegistry registry;
  ASSERT_TRUE(registry.add(Job{1, 20, std::nullopt, false}));
  ASSERT_TRUE(registry.add(Job{1, 21, std::nullopt, false}));
  registry.markCompleted(20);
  registry.markCompleted(21);

  auto taken = registry.takeCompleted(1);
  ASSERT_EQ(taken.size(), 2u);
  registry.restore(taken);

  EXPECT_EQ(registry.size(), 2u);
  EXPECT_EQ(registry.takeCompleted(1).size(), 2u);
}

// Many pollers racing over the same user must hand out each job exactly once.
TEST(JobRegistryTest, ConcurrentTakeHandsOutEachJobOnce) {
  constexpr int kJobs = 2000;
  constexpr int kThreads = 8;

  JobRegistry registry;
  for (int i = 1; i <= kJobs; ++i) {
    ASSERT_TRUE(registry.add(Job{1, i, std::nullopt, false}));
  }

  std::atomic<bool> producing{true};
  std::mutex taken_mutex;
  std::vector<int64_t> taken_ids;

  std::vector<std::thread> takers;
  for (int t = 0; t < kThreads; ++t) {
    takers.emplace_back([&]() {
      while (true) {
        const bool last_round = !producing.load();
        auto jobs = registry.takeCompleted(1);
        {
          std::lock_guard<std::mutex> lock(taken_mutex);
          for (const auto& job : jobs) taken_ids.push_back(job.video_id);
        }
        if (last_round) break;
      }
    });
  }

  for (int i = 1; i <= kJobs; ++i) {
    registry.markCompleted(i);
  }
  producing.store(false);
  for (auto& t : takers) t.join();

  ASSERT_EQ(taken_ids.size(), static_cast<size_t>(kJobs));
  std::set<int64_t> unique(taken_ids.begin(), taken_ids.end());
  EXPECT_EQ(unique.size(), static_cast<size_t>(kJobs));
  EXPECT_EQ(registry.size(), 0u);
}

} // namespace
} // namespace clip_service
