#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "application/clip_service.hpp"
#include "common/restful/http_server.hpp"
#include "common/thread_pool.hpp"
#include "infrastructure/websocket_channel.hpp"
#include "interface/notification_socket_handler.hpp"
#include "test_support.hpp"

namespace clip_service {
namespace {

using namespace std::chrono_literals;
using test::FakeIdentity;
using test::FakeTranscoder;
using test::TempDir;

// Blocking websocket client on its own io_context.
class Client {
public:
  void connect(unsigned short port, const std::string& target) {
    ws_.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    ws_.handshake("127.0.0.1", target);
  }

  // The next text frame, or nullopt once the server has closed the connection.
  std::optional<std::string> read() {
    beast::flat_buffer buffer;
    beast::error_code ec;
    ws_.read(buffer, ec);
    if (ec) {
      close_reason_ = ec;
      return std::nullopt;
    }
    return beast::buffers_to_string(buffer.data());
  }

  beast::error_code closeReason() const { return close_reason_; }

private:
  net::io_context ioc_;
  websocket::stream<tcp::socket> ws_{ioc_};
  beast::error_code close_reason_;
};

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2s) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

// Server side io_context on a background thread, torn down in reverse order.
class LoopbackTest : public ::testing::Test {
protected:
  void startServer(std::shared_ptr<common::WebSocketHandlerBase> ws_handler) {
    server.emplace(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0), nullptr, ws_handler);
    server->run();
    io_thread = std::thread([this]() { ioc.run(); });
  }

  unsigned short port() const { return server->localEndpoint().port(); }

  void TearDown() override {
    if (server) {
      server->stop();
    }
    work.reset();
    ioc.stop();
    if (io_thread.joinable()) {
      io_thread.join();
    }
  }

  net::io_context ioc;
  std::optional<net::executor_work_guard<net::io_context::executor_type>> work{net::make_work_guard(ioc)};
  std::optional<common::HttpServer> server;
  std::thread io_thread;
};

// Hands every accepted session to the test.
class CapturingHandler : public common::WebSocketHandlerBase {
public:
  std::optional<http::response<http::string_body>> checkUpgrade(
    const http::request<http::string_body>&) override {
    return std::nullopt;
  }

  void onOpen(std::shared_ptr<common::WebSocketSession> session,
              const http::request<http::string_body>&) override {
    opened.set_value(std::move(session));
  }

  std::promise<std::shared_ptr<common::WebSocketSession>> opened;
};

using WebSocketSessionTest = LoopbackTest;

TEST_F(WebSocketSessionTest, FramesAcceptedBeforeCloseArriveAndLaterSendsFail) {
  auto handler = std::make_shared<CapturingHandler>();
  auto opened = handler->opened.get_future();
  startServer(handler);

  Client client;
  client.connect(port(), "/ws/notifications");
  ASSERT_EQ(opened.wait_for(2s), std::future_status::ready);
  WebSocketChannel channel(opened.get());

  ASSERT_TRUE(channel.isOpen());
  EXPECT_TRUE(channel.send("{\"video_id\":41}"));
  channel.close();
  EXPECT_FALSE(channel.isOpen());
  EXPECT_FALSE(channel.send("{\"video_id\":42}"));

  auto first = client.read();
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, "{\"video_id\":41}");
  EXPECT_FALSE(client.read());
  EXPECT_EQ(client.closeReason(), websocket::error::closed);
}

TEST_F(WebSocketSessionTest, CloseHandlerRunsOnceWhenThePeerLeaves) {
  auto handler = std::make_shared<CapturingHandler>();
  auto opened = handler->opened.get_future();
  startServer(handler);

  std::atomic<int> closed{0};
  {
    Client client;
    client.connect(port(), "/ws/notifications");
    ASSERT_EQ(opened.wait_for(2s), std::future_status::ready);
    opened.get()->setCloseHandler([&closed]() { ++closed; });
  }

  EXPECT_TRUE(waitFor([&]() { return closed.load() == 1; }));
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(closed.load(), 1);
}

// Whole notification path: HttpServer, NotificationSocketHandler, ClipService.
class NotificationSocketTest : public LoopbackTest {
protected:
  void SetUp() override {
    auto worker = std::make_shared<CompressionWorker>(std::make_shared<FakeTranscoder>(), repo, registry, pool);
    auto ingestor = std::make_shared<UploadIngestor>(dir.str(), repo, registry, worker);
    service = std::make_shared<ClipService>(ioc.get_executor(), ingestor, repo, repo, registry,
                                            connections, 500ms);
    startServer(std::make_shared<NotificationSocketHandler>(service, std::make_shared<FakeIdentity>()));
  }

  void TearDown() override {
    service->shutdown();
    LoopbackTest::TearDown();
    pool->shutdown();
  }

  size_t historyCount() {
    auto records = repo->findByUser(3);
    return records ? records->size() : 0;
  }

  TempDir dir;
  std::shared_ptr<MemoryVideoRepository> repo = std::make_shared<MemoryVideoRepository>();
  std::shared_ptr<JobRegistry> registry = std::make_shared<JobRegistry>();
  std::shared_ptr<ConnectionManager> connections = std::make_shared<ConnectionManager>();
  std::shared_ptr<common::ThreadPool> pool = std::make_shared<common::ThreadPool>(1);
  std::shared_ptr<ClipService> service;
};

TEST_F(NotificationSocketTest, EvictedSocketIsClosedAndReplacementGetsTheJobOnce) {
  Client first;
  first.connect(port(), "/ws/notifications?token=good");
  ASSERT_TRUE(waitFor([&]() { return connections->size() == 1; }));
  auto first_connection = connections->find(3);

  // completes while the first connection's loop has not ticked yet
  ASSERT_TRUE(registry->add(Job{3, 42, 7, false}));
  ASSERT_TRUE(registry->markCompleted(42));

  Client second;
  second.connect(port(), "/ws/notifications?token=good");

  EXPECT_FALSE(first.read());
  EXPECT_EQ(first.closeReason(), websocket::error::closed);

  auto message = second.read();
  ASSERT_TRUE(message);
  auto json = nlohmann::json::parse(*message);
  EXPECT_EQ(json["video_id"], 42);
  EXPECT_EQ(json["route_id"], 7);

  ASSERT_TRUE(waitFor([&]() { return historyCount() == 1; }));
  EXPECT_FALSE(registry->find(42));
  EXPECT_NE(connections->find(3), first_connection);
  EXPECT_EQ(connections->size(), 1u);

  // a couple more ticks of the live loop deliver nothing new
  std::this_thread::sleep_for(1100ms);
  EXPECT_EQ(historyCount(), 1u);
}

TEST_F(NotificationSocketTest, UpgradeWithoutValidTokenIsRefused) {
  Client client;
  EXPECT_THROW(client.connect(port(), "/ws/notifications?token=forged"), boost::system::system_error);
  EXPECT_EQ(connections->size(), 0u);
}

} // namespace
} // namespace clip_service
