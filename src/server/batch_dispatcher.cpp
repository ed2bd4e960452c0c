#include "deepsearch/server/batch_dispatcher.hpp"
#include "deepsearch/server/worker_pool.hpp"
#include "deepsearch/utils/logging.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace deepsearch {
namespace server {

namespace {

types::WorkResult unknownResult(const std::string &item,
                                const std::string &summary) {
  types::WorkResult result;
  result.item_id = item;
  result.relationship_type = types::RelationshipType::Unknown;
  result.summary = summary;
  return result;
}

} // namespace

// Threads running the lookups of one session. At most `capacity` exist at a
// time, lookups that outlived their timeout included.
class BatchDispatcher::LookupThreads {
public:
  explicit LookupThreads(std::size_t capacity)
      : capacity_(std::max<std::size_t>(capacity, 1)) {}

  ~LookupThreads() { joinAll(); }

  /**
   * @brief Run a job on a new thread once a slot is free
   *
   * @param job Must not throw
   * @param deadline Latest time to wait for a slot
   * @return false if no slot freed up before the deadline
   */
  bool launch(std::function<void()> job,
              std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_until(lock, deadline,
                        [this]() { return running_ < capacity_; })) {
      return false;
    }
    reapLocked();
    ++running_;

    auto done = std::make_shared<bool>(false);
    std::thread thread([this, job = std::move(job), done]() {
      job();
      std::lock_guard<std::mutex> lock(mutex_);
      *done = true;
      --running_;
      cv_.notify_all();
    });
    threads_.push_back(Entry{std::move(thread), done});
    return true;
  }

  void joinAll() {
    std::vector<Entry> threads;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      threads.swap(threads_);
    }
    for (auto &entry : threads) {
      if (entry.thread.joinable()) {
        entry.thread.join();
      }
    }
  }

private:
  struct Entry {
    std::thread thread;
    std::shared_ptr<bool> done;
  };

  // A finished thread no longer needs the mutex, so joining here is brief
  void reapLocked() {
    for (auto it = threads_.begin(); it != threads_.end();) {
      if (*it->done) {
        it->thread.join();
        it = threads_.erase(it);
      } else {
        ++it;
      }
    }
  }

  const std::size_t capacity_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t running_ = 0;
  std::vector<Entry> threads_;
};

BatchDispatcher::BatchDispatcher(std::shared_ptr<LookupWorker> worker,
                                 const Config &config)
    : worker_(std::move(worker)), config_(config) {
  if (config_.batch_size == 0) {
    config_.batch_size = 1;
  }
  if (config_.worker_pool_width == 0) {
    config_.worker_pool_width = 1;
  }
}

BatchDispatcher::~BatchDispatcher() { stop(); }

bool BatchDispatcher::start(const std::shared_ptr<SearchSession> &session) {
  std::lock_guard<std::mutex> lock(threads_mutex_);
  if (stopping_) {
    return false;
  }
  if (!session->advanceStatus(types::SessionStatus::Running)) {
    return false;
  }

  reapFinishedLocked();

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([this, session, done]() {
    dispatchLoop(session);
    *done = true;
  });

  threads_[session->id()] = DispatchThread{std::move(thread), done};
  return true;
}

std::vector<types::WorkResult>
BatchDispatcher::runFor(const std::shared_ptr<SearchSession> &session,
                        const std::unordered_set<std::string> &known_ids,
                        std::chrono::steady_clock::time_point deadline,
                        std::size_t min_results) {
  start(session);

  while (true) {
    auto snap = session->snapshot();

    std::vector<types::WorkResult> fresh;
    for (auto &result : session->resultsSince(0)) {
      if (known_ids.count(result.item_id) == 0) {
        fresh.push_back(std::move(result));
      }
    }

    if (fresh.size() >= min_results || types::isTerminal(snap.status) ||
        std::chrono::steady_clock::now() >= deadline) {
      return fresh;
    }

    session->waitForChange(snap.version, deadline);
  }
}

void BatchDispatcher::stop() {
  std::unordered_map<std::string, DispatchThread> threads;
  {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    stopping_ = true;
    threads.swap(threads_);
  }

  for (auto &entry : threads) {
    if (entry.second.thread.joinable()) {
      entry.second.thread.join();
    }
  }
}

std::size_t BatchDispatcher::activeCount() const {
  std::lock_guard<std::mutex> lock(threads_mutex_);
  std::size_t count = 0;
  for (const auto &entry : threads_) {
    if (!*entry.second.done) {
      ++count;
    }
  }
  return count;
}

const BatchDispatcher::Config &BatchDispatcher::config() const {
  return config_;
}

void BatchDispatcher::dispatchLoop(std::shared_ptr<SearchSession> session) {
  const std::string &target = session->target();

  try {
    auto pending = session->pendingItems();
    const std::size_t total_batches =
        (pending.size() + config_.batch_size - 1) / config_.batch_size;

    DEEPSEARCH_LOG_INFO("Session " + session->id() + ": dispatching " +
                        std::to_string(pending.size()) + " items in " +
                        std::to_string(total_batches) + " batches");

    LookupThreads lookups(config_.worker_pool_width);
    WorkerPool pool(config_.worker_pool_width);

    for (std::size_t batch = 0; batch < total_batches; ++batch) {
      if (stopping_ ||
          session->status() != types::SessionStatus::Running) {
        break;
      }

      session->setBatchProgress(batch + 1, total_batches);

      const std::size_t begin = batch * config_.batch_size;
      const std::size_t end =
          std::min(pending.size(), begin + config_.batch_size);

      for (std::size_t i = begin; i < end; ++i) {
        const std::string item = pending[i];
        pool.submit([this, &lookups, session, target, item]() {
          session->recordResult(investigateWithTimeout(lookups, target, item));
        });
      }

      pool.waitIdle();
    }

    pool.stop();

    if (session->completedCount() == session->items().size()) {
      session->advanceStatus(types::SessionStatus::Completed);
      DEEPSEARCH_LOG_INFO("Session " + session->id() + " completed");
    } else if (session->advanceStatus(types::SessionStatus::Cancelled)) {
      DEEPSEARCH_LOG_INFO("Session " + session->id() + " cancelled after " +
                          std::to_string(session->completedCount()) + " of " +
                          std::to_string(session->items().size()) + " items");
    }
  } catch (const std::exception &e) {
    DEEPSEARCH_LOG_ERROR("Session " + session->id() +
                         ": dispatch failed: " + e.what());
    session->advanceStatus(types::SessionStatus::Failed);
  }
}

types::WorkResult
BatchDispatcher::investigateWithTimeout(LookupThreads &lookups,
                                        const std::string &target,
                                        const std::string &item) {
  const auto deadline = std::chrono::steady_clock::now() + config_.lookup_timeout;
  const std::string timeout_summary =
      "Lookup timed out after " +
      std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                         config_.lookup_timeout)
                         .count()) +
      " seconds";

  auto promise = std::make_shared<std::promise<types::WorkResult>>();
  auto future = promise->get_future();
  auto worker = worker_;

  bool launched = lookups.launch(
      [promise, worker, target, item]() {
        try {
          promise->set_value(worker->investigate(target, item));
        } catch (...) {
          promise->set_exception(std::current_exception());
        }
      },
      deadline);

  if (!launched) {
    DEEPSEARCH_LOG_WARNING("Lookup of " + item +
                           " timed out waiting for a free lookup slot");
    return unknownResult(item, timeout_summary);
  }

  if (future.wait_until(deadline) == std::future_status::timeout) {
    DEEPSEARCH_LOG_WARNING("Lookup of " + item + " timed out");
    return unknownResult(item, timeout_summary);
  }

  try {
    auto result = future.get();
    result.item_id = item;
    return result;
  } catch (const std::exception &e) {
    DEEPSEARCH_LOG_WARNING("Lookup of " + item + " failed: " + e.what());
    return unknownResult(item, std::string("Processing error: ") + e.what());
  }
}

void BatchDispatcher::reapFinishedLocked() {
  for (auto it = threads_.begin(); it != threads_.end();) {
    if (*it->second.done) {
      if (it->second.thread.joinable()) {
        it->second.thread.join();
      }
      it = threads_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace server
} // namespace deepsearch
