#ifndef DEEPSEARCH_SERVER_BATCH_DISPATCHER_HPP_
#define DEEPSEARCH_SERVER_BATCH_DISPATCHER_HPP_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "deepsearch/server/lookup_worker.hpp"
#include "deepsearch/server/session_registry.hpp"
#include "deepsearch/types.hpp"

namespace deepsearch {
namespace server {

/**
 * @brief Runs the items of a session through a lookup worker in batches
 *
 * Each running session gets one dispatch thread and its own bounded worker
 * pool. Results are written to the session in completion order as they land.
 */
class BatchDispatcher {
public:
  struct Config {
    /**
     * @brief Lookups running concurrently for one session
     */
    std::size_t worker_pool_width = 5;

    /**
     * @brief Items per batch
     */
    std::size_t batch_size = 5;

    /**
     * @brief Time allowed for one lookup before an Unknown result is
     * synthesised
     *
     * A lookup that times out keeps its thread, and its slot, until the
     * worker returns; workers should bound their own calls below this.
     */
    std::chrono::milliseconds lookup_timeout = std::chrono::seconds(120);
  };

  BatchDispatcher(std::shared_ptr<LookupWorker> worker)
      : BatchDispatcher(std::move(worker), Config()) {}
  BatchDispatcher(std::shared_ptr<LookupWorker> worker, const Config &config);

  /**
   * @brief Stops and joins all dispatch threads
   */
  ~BatchDispatcher();

  BatchDispatcher(const BatchDispatcher &) = delete;
  BatchDispatcher &operator=(const BatchDispatcher &) = delete;

  /**
   * @brief Start processing a Pending session
   *
   * Sessions already running or terminal are left untouched, so calling this
   * again for the same session is harmless.
   *
   * @param session The session
   * @return true if this call started the session
   */
  bool start(const std::shared_ptr<SearchSession> &session);

  /**
   * @brief Run a session until enough results unknown to the caller exist
   *
   * Starts the session if needed, then waits until at least min_results
   * results outside known_ids are stored, the session is terminal, or the
   * deadline passes.
   *
   * @param session The session
   * @param known_ids Ids the caller already holds
   * @param deadline When to give up waiting
   * @param min_results Results to wait for
   * @return std::vector<types::WorkResult> Stored results outside known_ids,
   * in completion order
   */
  std::vector<types::WorkResult>
  runFor(const std::shared_ptr<SearchSession> &session,
         const std::unordered_set<std::string> &known_ids,
         std::chrono::steady_clock::time_point deadline,
         std::size_t min_results);

  /**
   * @brief Stop dispatching and join every dispatch thread
   *
   * Running sessions stop after their current batch and become Cancelled.
   * Returns once every lookup thread, timed out or not, has finished.
   */
  void stop();

  /**
   * @brief Number of dispatch threads not yet finished
   */
  std::size_t activeCount() const;

  const Config &config() const;

private:
  struct DispatchThread {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  class LookupThreads;

  void dispatchLoop(std::shared_ptr<SearchSession> session);

  types::WorkResult investigateWithTimeout(LookupThreads &lookups,
                                           const std::string &target,
                                           const std::string &item);

  void reapFinishedLocked();

  std::shared_ptr<LookupWorker> worker_;
  Config config_;

  std::atomic<bool> stopping_{false};

  mutable std::mutex threads_mutex_;
  std::unordered_map<std::string, DispatchThread> threads_;
};

} // namespace server
} // namespace deepsearch

#endif // DEEPSEARCH_SERVER_BATCH_DISPATCHER_HPP_
