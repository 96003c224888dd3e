#include "upload_ingestor.hpp"
#include <uuid/uuid.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace clip_service {

namespace {

std::string randomToken() {
  uuid_t uuid;
  uuid_generate_random(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

} // namespace

UploadIngestor::UploadIngestor(std::string storage_path,
                               std::shared_ptr<VideoRepository> videos,
                               std::shared_ptr<JobRegistry> registry,
                               std::shared_ptr<CompressionWorker> worker)
  : storage_path_(std::move(storage_path)),
    videos_(std::move(videos)),
    registry_(std::move(registry)),
    worker_(std::move(worker)) {}

std::string UploadIngestor::sanitizeFileName(std::string_view name) {
  // keep only the last path component, whichever separator the client used
  if (auto slash = name.find_last_of("/\\"); slash != std::string_view::npos) {
    name.remove_prefix(slash + 1);
  }

  std::string clean;
  clean.reserve(name.size());
  for (unsigned char c : name) {
    if (std::isalnum(c) || c == '.' || c == '-' || c == '_') {
      clean += static_cast<char>(c);
    } else if (c == ' ') {
      clean += '_';
    }
  }

  // no hidden files and no "." / ".."
  auto first = clean.find_first_not_of('.');
  if (first == std::string::npos) {
    return "";
  }
  clean.erase(0, first);

  if (clean.size() > 128) {
    clean.erase(0, clean.size() - 128);
  }
  return clean;
}

std::string UploadIngestor::generateFilePath(const std::string& name) const {
  return (std::filesystem::path(storage_path_) / (randomToken() + "-" + name)).string();
}

std::expected<int64_t, std::string> UploadIngestor::ingest(int64_t user_id,
                                                           std::optional<int64_t> route_id,
                                                           std::string_view bytes,
                                                           const std::string& suggested_name) {
  std::error_code ec;
  std::filesystem::create_directories(storage_path_, ec);
  if (ec) {
    return std::unexpected("Cannot create storage directory " + storage_path_ + ": " + ec.message());
  }

  const auto name = sanitizeFileName(suggested_name);
  auto output_name = name;
  if (std::filesystem::path(output_name).extension().empty()) {
    output_name += COMPRESSED_FILE_EXTENSION;
  }
  const auto raw_path = generateFilePath(name);
  const auto output_path = generateFilePath(output_name);

  if (auto written = writeFile(raw_path, bytes); !written) {
    return std::unexpected(written.error());
  }

  VideoRecord video;
  video.path = output_path;
  video.route_id = route_id;
  video.completed = false;
  video.failed = false;
  video.created_at = std::chrono::system_clock::now();

  auto stored = videos_->insert(video);
  if (!stored) {
    rollback(raw_path, std::nullopt);
    return std::unexpected("Failed to create video record: " + stored.error());
  }
  const auto video_id = stored->id;

  if (auto added = registry_->add(Job{user_id, video_id, route_id, false}); !added) {
    rollback(raw_path, video_id);
    return std::unexpected(added.error());
  }

  auto scheduled = worker_->schedule(CompressionTask{raw_path, output_path, video_id});
  if (!scheduled) {
    registry_->discard(video_id);
    rollback(raw_path, video_id);
    return std::unexpected(scheduled.error());
  }

  std::cout << "[UploadIngestor] user " << user_id << ": stored " << bytes.size()
            << " bytes as video " << video_id << std::endl;
  return video_id;
}

std::expected<void, std::string> UploadIngestor::writeFile(const std::string& path, std::string_view bytes) {
  if (std::filesystem::exists(path)) {
    return std::unexpected("Refusing to overwrite existing file " + path);
  }

  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  if (!os) {
    return std::unexpected("Cannot open " + path + " for writing");
  }

  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  const bool ok = static_cast<bool>(os);
  os.close();

  if (!ok || os.fail()) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return std::unexpected("Failed to write " + std::to_string(bytes.size()) + " bytes to " + path);
  }
  return {};
}

void UploadIngestor::rollback(const std::string& raw_path, std::optional<int64_t> video_id) {
  std::cerr << "[UploadIngestor] rolling back upload " << raw_path << std::endl;

  if (video_id) {
    if (auto removed = videos_->remove(*video_id); !removed) {
      std::cerr << "[UploadIngestor] could not remove video record " << *video_id
                << ": " << removed.error() << std::endl;
    }
  }

  std::error_code ec;
  std::filesystem::remove(raw_path, ec);
  if (ec) {
    std::cerr << "[UploadIngestor] could not remove " << raw_path << ": " << ec.message() << std::endl;
  }
}

} // namespace clip_service
