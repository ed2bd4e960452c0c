#ifndef DEEPSEARCH_SERVER_WORKER_POOL_HPP_
#define DEEPSEARCH_SERVER_WORKER_POOL_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace deepsearch {
namespace server {

/**
 * @brief Fixed-width pool of threads draining a task queue
 */
class WorkerPool {
public:
  using Task = std::function<void()>;

  /**
   * @brief Start the pool
   *
   * @param width Number of worker threads (at least one)
   */
  explicit WorkerPool(std::size_t width);

  /**
   * @brief Stop the pool, running every task already queued
   */
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Queue a task
   *
   * @return false if the pool is stopping and the task was dropped
   */
  bool submit(Task task);

  /**
   * @brief Block until the queue is empty and no task is running
   */
  void waitIdle();

  /**
   * @brief Finish queued tasks and join the workers
   */
  void stop();

  std::size_t width() const;

private:
  void workerThread();

  std::vector<std::thread> workers_;

  std::mutex mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  std::size_t running_ = 0;
  std::atomic<bool> stopping_{false};
};

} // namespace server
} // namespace deepsearch

#endif // DEEPSEARCH_SERVER_WORKER_POOL_HPP_
