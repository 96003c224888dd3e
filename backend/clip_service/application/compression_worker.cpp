#include "compression_worker.hpp"
#include <filesystem>
#include <iostream>

namespace clip_service {

CompressionWorker::CompressionWorker(std::shared_ptr<TranscodingService> transcoder,
                                     std::shared_ptr<VideoRepository> videos,
                                     std::shared_ptr<JobRegistry> registry,
                                     std::shared_ptr<common::ThreadPool> pool)
  : transcoder_(std::move(transcoder)),
    videos_(std::move(videos)),
    registry_(std::move(registry)),
    pool_(std::move(pool)) {}

std::expected<std::future<TranscodeOutcome>, std::string> CompressionWorker::schedule(const CompressionTask& task) {
  try {
    return pool_->commit([self = shared_from_this(), task]() {
      return self->run(task);
    });
  } catch (const std::exception& e) {
    return std::unexpected("Failed to schedule compression: " + std::string(e.what()));
  }
}

TranscodeOutcome CompressionWorker::run(const CompressionTask& task) {
  try {
    std::cout << "[CompressionWorker] video " << task.video_id << ": transcoding "
              << task.raw_path << " -> " << task.output_path << std::endl;

    if (auto result = transcoder_->transcode(task.raw_path, task.output_path); !result) {
      return recordFailure(task, result.error(), true);
    }

    std::error_code ec;
    std::filesystem::remove(task.raw_path, ec);
    if (ec) {
      std::cerr << "[CompressionWorker] video " << task.video_id << ": could not remove "
                << task.raw_path << ": " << ec.message() << std::endl;
    }

    auto video = videos_->findByPath(task.output_path);
    if (!video) {
      return recordFailure(task, "record lookup failed: " + video.error(), false);
    }

    video->completed = true;
    video->failed = false;
    if (auto updated = videos_->update(*video); !updated) {
      return recordFailure(task, "could not persist completion: " + updated.error(), false);
    }

    // the record is updated first so a notified user always finds it completed
    if (!registry_->markCompleted(task.video_id)) {
      std::cerr << "[CompressionWorker] video " << task.video_id << ": no job registered" << std::endl;
    }

    std::cout << "[CompressionWorker] video " << task.video_id << ": completed" << std::endl;
    return TranscodeOutcome::Completed;
  } catch (const std::exception& e) {
    std::error_code ec;
    return recordFailure(task, e.what(), std::filesystem::exists(task.raw_path, ec));
  }
}

TranscodeOutcome CompressionWorker::recordFailure(const CompressionTask& task, const std::string& reason,
                                                 bool raw_kept) {
  std::cerr << "[CompressionWorker] video " << task.video_id << ": transcode failed: " << reason;
  if (raw_kept) {
    std::cerr << " (raw upload kept at " << task.raw_path << ")" << std::endl;
  } else {
    std::cerr << " (raw upload already removed, output at " << task.output_path << ")" << std::endl;
  }

  // failures are never pushed to the uploader, only recorded on the video
  registry_->discard(task.video_id);

  try {
    auto video = videos_->findByPath(task.output_path);
    if (!video) {
      std::cerr << "[CompressionWorker] video " << task.video_id << ": record lookup failed: "
                << video.error() << std::endl;
      return TranscodeOutcome::Failed;
    }
    video->failed = true;
    video->completed = false;
    if (auto updated = videos_->update(*video); !updated) {
      std::cerr << "[CompressionWorker] video " << task.video_id << ": could not persist failure: "
                << updated.error() << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "[CompressionWorker] video " << task.video_id << ": could not persist failure: "
              << e.what() << std::endl;
  }
  return TranscodeOutcome::Failed;
}

} // namespace clip_service
