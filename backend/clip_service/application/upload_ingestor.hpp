#pragma once

#include "application/compression_worker.hpp"
#include "application/job_registry.hpp"
#include "domain/video_repository.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace clip_service {

class UploadIngestor {
public:
  UploadIngestor(std::string storage_path,
                 std::shared_ptr<VideoRepository> videos,
                 std::shared_ptr<JobRegistry> registry,
                 std::shared_ptr<CompressionWorker> worker);

  // Stores the upload, creates its video record and job, queues the transcode
  // and returns the new video id without waiting for the transcode. On error
  // nothing is left behind: no file, no record, no job.
  std::expected<int64_t, std::string> ingest(int64_t user_id,
                                             std::optional<int64_t> route_id,
                                             std::string_view bytes,
                                             const std::string& suggested_name);

  // Reduces a client supplied name to a bare file name made of [A-Za-z0-9._-].
  static std::string sanitizeFileName(std::string_view name);

  // <storage>/<random uuid>-<name>
  std::string generateFilePath(const std::string& name) const;

  const std::string& storagePath() const { return storage_path_; }

private:
  std::expected<void, std::string> writeFile(const std::string& path, std::string_view bytes);
  void rollback(const std::string& raw_path, std::optional<int64_t> video_id);

  std::string storage_path_;
  std::shared_ptr<VideoRepository> videos_;
  std::shared_ptr<JobRegistry> registry_;
  std::shared_ptr<CompressionWorker> worker_;
};

} // namespace clip_service
