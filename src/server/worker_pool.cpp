#include "deepsearch/server/worker_pool.hpp"
#include "deepsearch/utils/logging.hpp"

#include <exception>

namespace deepsearch {
namespace server {

WorkerPool::WorkerPool(std::size_t width) {
  if (width == 0) {
    width = 1;
  }
  workers_.reserve(width);
  for (std::size_t i = 0; i < width; ++i) {
    workers_.emplace_back(&WorkerPool::workerThread, this);
  }
}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return false;
    }
    queue_.push_back(std::move(task));
  }
  queue_cv_.notify_one();
  return true;
}

void WorkerPool::waitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() { return queue_.empty() && running_ == 0; });
}

void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  queue_cv_.notify_all();

  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

std::size_t WorkerPool::width() const { return workers_.size(); }

void WorkerPool::workerThread() {
  while (true) {
    Task task;

    // Wait for a task
    {
      std::unique_lock<std::mutex> lock(mutex_);

      queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });

      if (stopping_ && queue_.empty()) {
        break;
      }

      task = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }

    try {
      task();
    } catch (const std::exception &e) {
      DEEPSEARCH_LOG_ERROR(std::string("Worker task failed: ") + e.what());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
      if (queue_.empty() && running_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

} // namespace server
} // namespace deepsearch
