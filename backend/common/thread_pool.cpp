#include "thread_pool.hpp"

namespace common {

ThreadPool::ThreadPool(unsigned int size) {
  _poolSize = size < 1 ? 2 : size;
  _threads.reserve(_poolSize);

  for (size_t i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{_mtx};
      _cv.wait(lock, [this]() -> bool {
        return _stop.load(std::memory_order_acquire) || !_tasks.empty();
      });

      // drain whatever is queued before exiting
      if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
        return;
      }

      task = std::move(_tasks.front());
      _tasks.pop();
    }
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock{_mtx};
    if (_stop.load(std::memory_order_relaxed) && _threads.empty()) {
      return;
    }
    _stop.store(true, std::memory_order_release);
  }
  _cv.notify_all();

  for (auto& t : _threads) {
    if (!t.joinable()) {
      continue;
    }
    if (t.get_id() == std::this_thread::get_id()) {
      t.detach();
    } else {
      t.join();
    }
  }
  _threads.clear();
}

size_t ThreadPool::pending() const {
  std::lock_guard<std::mutex> lock{_mtx};
  return _tasks.size();
}

} // namespace common
