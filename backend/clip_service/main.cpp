#include "application/clip_service.hpp"
#include "application/compression_worker.hpp"
#include "application/connection_manager.hpp"
#include "application/job_registry.hpp"
#include "application/upload_ingestor.hpp"
#include "infrastructure/jwt_identity_service.hpp"
#include "infrastructure/memory_video_repository.hpp"
#include "infrastructure/mysql_video_repository.hpp"
#include "infrastructure/subprocess_transcoder.hpp"
#include "interface/notification_socket_handler.hpp"
#include "interface/rest_api_handler.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include "common/restful/http_server.hpp"
#include "common/thread_pool.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

int main(int argc, char** argv) {
  try {
    auto& cfg = config::Config::getInstance();
    if (argc > 1) {
      cfg.loadFromFile(argv[1]);
    }
    cfg.loadFromEnvironment();

    const auto& storage_path = cfg.getStoragePath();
    std::filesystem::create_directories(storage_path);

    if (cfg.getAuth().jwt_secret.empty()) {
      throw std::runtime_error("auth.jwt_secret is not set (config file or CRAGCLIP_JWT_SECRET)");
    }

    std::shared_ptr<clip_service::VideoRepository> videos;
    std::shared_ptr<clip_service::JobHistoryRepository> history;
    const auto& db_config = cfg.getDatabase();
    if (db_config.backend == "memory") {
      auto repository = std::make_shared<clip_service::MemoryVideoRepository>();
      videos = repository;
      history = repository;
      std::cout << "Using in-memory repository" << std::endl;
    } else if (db_config.backend == "mysql") {
      auto repository = std::make_shared<clip_service::MysqlVideoRepository>();
      if (auto schema = repository->ensureSchema(); !schema) {
        throw std::runtime_error("Failed to prepare database schema: " + schema.error());
      }
      videos = repository;
      history = repository;
      std::cout << "Using MySQL repository " << db_config.host << ":" << db_config.port
                << "/" << db_config.db_name << std::endl;
    } else {
      throw std::runtime_error("Unknown database backend: " + db_config.backend);
    }

    const auto& transcode_config = cfg.getTranscode();
    auto pool = std::make_shared<common::ThreadPool>(std::max(1u, transcode_config.worker_threads));
    // job history writes from the notification loops
    auto history_pool = std::make_shared<common::ThreadPool>(2);
    auto transcoder = std::make_shared<clip_service::SubprocessTranscoder>(transcode_config);
    auto identity = std::make_shared<clip_service::JwtIdentityService>(cfg.getAuth());

    auto registry = std::make_shared<clip_service::JobRegistry>();
    auto connections = std::make_shared<clip_service::ConnectionManager>();
    auto worker = std::make_shared<clip_service::CompressionWorker>(transcoder, videos, registry, pool);
    auto ingestor = std::make_shared<clip_service::UploadIngestor>(storage_path, videos, registry, worker);

    const auto& server_config = cfg.getServer();
    const int io_threads = std::max(1, server_config.io_threads);
    boost::asio::io_context ioc{io_threads};

    auto service = std::make_shared<clip_service::ClipService>(
      ioc.get_executor(), ingestor, videos, history, registry, connections,
      cfg.getNotification().tick_interval, history_pool);

    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(server_config.host),
      static_cast<unsigned short>(server_config.port)
    };

    auto api_handler = std::make_shared<clip_service::RestApiHandler>(service, identity);
    auto ws_handler = std::make_shared<clip_service::NotificationSocketHandler>(service, identity);
    common::HttpServer http_server{ioc, http_endpoint, api_handler, ws_handler,
                                   server_config.max_upload_bytes};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "Received signal " << signal_number << ", shutting down" << std::endl;
      http_server.stop();
      service->shutdown();
      ioc.stop();
    });

    http_server.run();
    std::cout << "HTTP Server listening on " << http_server.localEndpoint() << std::endl;

    std::vector<std::thread> io_workers;
    io_workers.reserve(io_threads - 1);
    for (int i = 1; i < io_threads; ++i) {
      io_workers.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();

    for (auto& t : io_workers) {
      t.join();
    }

    std::cout << "Waiting for " << pool->pending() << " queued transcodes" << std::endl;
    pool->shutdown();
    history_pool->shutdown();

    if (db_config.backend == "mysql") {
      auto& db_pool = common::MySQLConnectionPool::getInstance();
      const auto stats = db_pool.stats();
      std::cout << "Closing database pool (" << stats.created << " opened, "
                << stats.discarded << " discarded)" << std::endl;
      db_pool.shutdown();
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
