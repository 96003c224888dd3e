#pragma once

#include "domain/identity_service.hpp"
#include "domain/notification_channel.hpp"
#include "domain/transcoding_service.hpp"
#include "domain/video_repository.hpp"
#include "infrastructure/memory_video_repository.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <expected>
#include <functional>
#include <iterator>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace clip_service::test {

// Fresh directory under the system temp dir, removed with its contents.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("cragclip_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }

  size_t fileCount() const {
    size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(path_)) {
      if (entry.is_regular_file()) ++n;
    }
    return n;
  }

private:
  std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path& path) {
  std::ifstream is(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

// "good" belongs to user 3, everything else is rejected.
class FakeIdentity : public IdentityService {
public:
  std::expected<int64_t, std::string> authenticate(const std::string& token) override {
    if (token == "good") {
      return 3;
    }
    return std::unexpected("Invalid token");
  }
};

// Records every message; disconnect() plays the peer going away.
class FakeChannel : public NotificationChannel {
public:
  std::expected<void, std::string> send(const std::string& text) override {
    if (before_send_) {
      before_send_();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      return std::unexpected("channel closed");
    }
    if (fail_sends_) {
      return std::unexpected("send failed");
    }
    messages_.push_back(text);
    return {};
  }

  void close() override {
    if (before_close_) {
      before_close_();
    }
    ++close_calls_;
    disconnect();
  }

  bool isOpen() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
  }

  void onDisconnect(DisconnectHandler handler) override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!open_) {
      lock.unlock();
      handler();
      return;
    }
    handler_ = std::move(handler);
  }

  void disconnect() {
    DisconnectHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!open_) {
        return;
      }
      open_ = false;
      handler = std::move(handler_);
      handler_ = nullptr;
    }
    if (handler) {
      handler();
    }
  }

  void failSends(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_sends_ = fail;
  }

  std::vector<std::string> messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

  int closeCalls() const { return close_calls_.load(); }

  // Hooks run at the start of send()/close(); set them before the channel is shared.
  void beforeSend(std::function<void()> hook) { before_send_ = std::move(hook); }
  void beforeClose(std::function<void()> hook) { before_close_ = std::move(hook); }

private:
  mutable std::mutex mutex_;
  bool open_{true};
  bool fail_sends_{false};
  std::vector<std::string> messages_;
  DisconnectHandler handler_;
  std::atomic<int> close_calls_{0};
  std::function<void()> before_send_;
  std::function<void()> before_close_;
};

// Writes a small output file and succeeds, unless told to fail.
class FakeTranscoder : public TranscodingService {
public:
  using Script = std::function<std::expected<void, std::string>(const std::string&, const std::string&)>;

  FakeTranscoder() = default;
  explicit FakeTranscoder(Script script) : script_(std::move(script)) {}

  std::expected<void, std::string> transcode(const std::string& input_path,
                                             const std::string& output_path) override {
    ++calls_;
    if (script_) {
      return script_(input_path, output_path);
    }
    if (fail_) {
      return std::unexpected("scripted failure");
    }
    std::ofstream os(output_path, std::ios::binary);
    os << "compressed:" << readFile(input_path);
    return {};
  }

  void setFail(bool fail) { fail_ = fail; }
  int calls() const { return calls_.load(); }

private:
  Script script_;
  std::atomic<bool> fail_{false};
  std::atomic<int> calls_{0};
};

// Memory repository whose individual operations can be made to fail.
class FlakyVideoRepository : public VideoRepository {
public:
  std::expected<VideoRecord, std::string> insert(const VideoRecord& video) override {
    if (fail_insert) return std::unexpected("insert failed");
    return inner.insert(video);
  }
  std::expected<VideoRecord, std::string> findById(int64_t id) override {
    return inner.findById(id);
  }
  std::expected<VideoRecord, std::string> findByPath(const std::string& path) override {
    return inner.findByPath(path);
  }
  std::expected<void, std::string> update(const VideoRecord& video) override {
    if (fail_update) return std::unexpected("update failed");
    if (failing_updates > 0) {
      --failing_updates;
      return std::unexpected("update failed");
    }
    return inner.update(video);
  }
  std::expected<bool, std::string> remove(int64_t id) override {
    return inner.remove(id);
  }

  MemoryVideoRepository inner;
  std::atomic<bool> fail_insert{false};
  std::atomic<bool> fail_update{false};
  // fails this many updates, then recovers
  std::atomic<int> failing_updates{0};
};

} // namespace clip_service::test
