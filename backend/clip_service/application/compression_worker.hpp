#pragma once

#include "application/job_registry.hpp"
#include "common/thread_pool.hpp"
#include "domain/transcoding_service.hpp"
#include "domain/video_repository.hpp"
#include <expected>
#include <future>
#include <memory>
#include <string>

namespace clip_service {

enum class TranscodeOutcome { Completed, Failed };

// Runs each transcode on the worker pool, one attempt per upload. The video
// record is the source of truth: success sets completed and removes the raw
// upload, failure sets failed and keeps the raw upload for an operator.
class CompressionWorker : public std::enable_shared_from_this<CompressionWorker> {
public:
  CompressionWorker(std::shared_ptr<TranscodingService> transcoder,
                    std::shared_ptr<VideoRepository> videos,
                    std::shared_ptr<JobRegistry> registry,
                    std::shared_ptr<common::ThreadPool> pool);

  // Queues the task and returns without waiting for it. The queued task keeps
  // the worker alive until it has run.
  std::expected<std::future<TranscodeOutcome>, std::string> schedule(const CompressionTask& task);

  // The body of one scheduled task. Never throws.
  TranscodeOutcome run(const CompressionTask& task);

private:
  // Marks the record failed and drops the job. raw_kept only affects the log.
  TranscodeOutcome recordFailure(const CompressionTask& task, const std::string& reason, bool raw_kept);

  std::shared_ptr<TranscodingService> transcoder_;
  std::shared_ptr<VideoRepository> videos_;
  std::shared_ptr<JobRegistry> registry_;
  std::shared_ptr<common::ThreadPool> pool_;
};

} // namespace clip_service
