#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <optional>
#include <boost/asio.hpp>

#include "application/connection_manager.hpp"
#include "test_support.hpp"

namespace clip_service {
namespace {

using namespace std::chrono_literals;
using test::FakeChannel;

TEST(ConnectionManagerTest, RegisterStoresOneConnectionPerUser) {
  ConnectionManager manager;
  auto ch = std::make_shared<FakeChannel>();
  auto connection = manager.registerConnection(5, ch);

  ASSERT_NE(connection, nullptr);
  EXPECT_EQ(connection->user_id, 5);
  EXPECT_EQ(manager.find(5), connection);
  EXPECT_EQ(manager.find(6), nullptr);
  EXPECT_EQ(manager.size(), 1u);
}

TEST(ConnectionManagerTest, SecondRegistrationEvictsAndClosesTheFirst) {
  ConnectionManager manager;
  auto first = std::make_shared<FakeChannel>();
  auto second = std::make_shared<FakeChannel>();

  manager.registerConnection(5, first);
  auto current = manager.registerConnection(5, second);

  EXPECT_FALSE(first->isOpen());
  EXPECT_EQ(first->closeCalls(), 1);
  EXPECT_TRUE(second->isOpen());
  EXPECT_EQ(manager.size(), 1u);
  EXPECT_EQ(manager.find(5), current);
  EXPECT_EQ(manager.find(5)->channel, second);
}

TEST(ConnectionManagerTest, EvictionStopsTheOldLoopBeforeClosingItsChannel) {
  boost::asio::io_context ioc;
  auto registry = std::make_shared<JobRegistry>();
  auto history = std::make_shared<MemoryVideoRepository>();
  ConnectionManager manager;

  auto first = std::make_shared<FakeChannel>();
  auto first_loop = std::make_shared<NotificationLoop>(ioc.get_executor(), 5, first, registry, history, 5s);
  manager.registerConnection(5, first, first_loop);

  std::optional<NotificationLoop::State> state_at_close;
  first->beforeClose([&]() { state_at_close = first_loop->state(); });

  auto second = std::make_shared<FakeChannel>();
  auto second_loop = std::make_shared<NotificationLoop>(ioc.get_executor(), 5, second, registry, history, 5s);
  manager.registerConnection(5, second, second_loop);

  ASSERT_TRUE(state_at_close);
  EXPECT_EQ(*state_at_close, NotificationLoop::State::Disconnected);
  EXPECT_EQ(second_loop->state(), NotificationLoop::State::Connected);

  // a tick of the evicted loop can no longer take anything
  ASSERT_TRUE(registry->add(Job{5, 1, std::nullopt, false}));
  ASSERT_TRUE(registry->markCompleted(1));
  EXPECT_EQ(first_loop->tick(), 0u);
  EXPECT_TRUE(registry->find(1));

  manager.closeAll();
  EXPECT_EQ(second_loop->state(), NotificationLoop::State::Disconnected);
  ioc.run_for(10ms);
}

// The evicted channel's disconnect handler runs while the replacement is
// already installed and may call back into the manager.
TEST(ConnectionManagerTest, EvictedHandlerCannotRemoveReplacement) {
  ConnectionManager manager;
  auto first = std::make_shared<FakeChannel>();
  auto first_connection = manager.registerConnection(5, first);

  bool removed = true;
  std::shared_ptr<ActiveConnection> seen_during_close;
  first->onDisconnect([&]() {
    seen_during_close = manager.find(5);
    removed = manager.unregisterConnection(first_connection);
  });

  auto second = std::make_shared<FakeChannel>();
  auto second_connection = manager.registerConnection(5, second);

  EXPECT_EQ(seen_during_close, second_connection);
  EXPECT_FALSE(removed);
  EXPECT_EQ(manager.find(5), second_connection);
}

TEST(ConnectionManagerTest, UnregisterIsIdempotent) {
  ConnectionManager manager;
  auto connection = manager.registerConnection(9, std::make_shared<FakeChannel>());

  EXPECT_TRUE(manager.unregisterConnection(connection));
  EXPECT_FALSE(manager.unregisterConnection(connection));
  EXPECT_FALSE(manager.unregisterConnection(nullptr));
  EXPECT_EQ(manager.size(), 0u);
}

TEST(ConnectionManagerTest, CloseAllClosesEveryChannel) {
  ConnectionManager manager;
  auto a = std::make_shared<FakeChannel>();
  auto b = std::make_shared<FakeChannel>();
  manager.registerConnection(1, a);
  manager.registerConnection(2, b);

  manager.closeAll();

  EXPECT_FALSE(a->isOpen());
  EXPECT_FALSE(b->isOpen());
  EXPECT_EQ(manager.size(), 0u);
  EXPECT_TRUE(manager.snapshot().empty());
}

} // namespace
} // namespace clip_service
