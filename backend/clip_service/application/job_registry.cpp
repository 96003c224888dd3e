#include "job_registry.hpp"

namespace clip_service {

std::expected<void, std::string> JobRegistry::add(const Job& job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!jobs_.try_emplace(job.video_id, job).second) {
    return std::unexpected("Job already registered for video " + std::to_string(job.video_id));
  }
  return {};
}

bool JobRegistry::markCompleted(int64_t video_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(video_id);
  if (it == jobs_.end()) {
    return false;
  }
  it->second.completed = true;
  return true;
}

bool JobRegistry::discard(int64_t video_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.erase(video_id) > 0;
}

std::vector<Job> JobRegistry::takeCompleted(int64_t user_id) {
  std::vector<Job> taken;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    if (it->second.completed && it->second.user_id == user_id) {
      taken.push_back(it->second);
      it = jobs_.erase(it);
    } else {
      ++it;
    }
  }
  return taken;
}

void JobRegistry::restore(const std::vector<Job>& jobs) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& job : jobs) {
    jobs_.try_emplace(job.video_id, job);
  }
}

std::optional<Job> JobRegistry::find(int64_t video_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(video_id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Job> JobRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> jobs;
  jobs.reserve(jobs_.size());
  for (const auto& [_, job] : jobs_) {
    jobs.push_back(job);
  }
  return jobs;
}

size_t JobRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

} // namespace clip_service
