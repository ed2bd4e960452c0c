#ifndef DEEPSEARCH_SERVER_SESSION_REGISTRY_HPP_
#define DEEPSEARCH_SERVER_SESSION_REGISTRY_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "deepsearch/types.hpp"

namespace deepsearch {
namespace server {

/**
 * @brief Server-side state of one investigation
 *
 * A session owns the ordered item list and the results that have landed so
 * far. The batch dispatcher is its only writer; stream and poll handlers read
 * it and block on waitForChange() for updates. Every mutation bumps a version
 * counter and wakes the waiters.
 */
class SearchSession {
public:
  using Clock = std::chrono::steady_clock;

  /**
   * @brief Consistent view of the session counters
   */
  struct Snapshot {
    types::SessionStatus status = types::SessionStatus::Pending;
    std::size_t total = 0;
    std::size_t completed = 0;
    std::size_t current_batch = 0;
    std::size_t total_batches = 0;
    std::uint64_t version = 0;
  };

  SearchSession(std::string id, std::string target,
                std::vector<std::string> items);

  const std::string &id() const;
  const std::string &target() const;
  const std::vector<std::string> &items() const;

  types::SessionStatus status() const;

  /**
   * @brief Move the session to a later status
   *
   * Pending precedes Running, which precedes the terminal statuses. Moves
   * backwards, sideways or out of a terminal status are refused.
   *
   * @param next The new status
   * @return true if the status changed
   */
  bool advanceStatus(types::SessionStatus next);

  /**
   * @brief Store the result of one item
   *
   * @param result The result
   * @return true if stored; false for unknown or already completed items and
   * for terminal sessions
   */
  bool recordResult(const types::WorkResult &result);

  void setBatchProgress(std::size_t current_batch, std::size_t total_batches);

  /**
   * @brief Items without a result, in item order
   */
  std::vector<std::string> pendingItems() const;

  /**
   * @brief Ids of completed items, in completion order
   */
  std::vector<std::string> completedIds() const;

  /**
   * @brief Results from the given completion index onwards
   *
   * @param index Number of results the caller has already seen
   * @return std::vector<types::WorkResult> The newer results
   */
  std::vector<types::WorkResult> resultsSince(std::size_t index) const;

  std::size_t completedCount() const;

  Snapshot snapshot() const;

  /**
   * @brief Block until the version differs from seen_version or the deadline
   * passes
   *
   * @return true if the session changed
   */
  bool waitForChange(std::uint64_t seen_version, Clock::time_point deadline);

  /**
   * @brief Record client activity so the session is not expired
   */
  void touch();

  Clock::time_point createdAt() const;
  Clock::time_point lastActivityAt() const;

  /**
   * @brief Replace the ids the client reported as already processed
   *
   * The next resuming stream connection claims these ids and skips them when
   * replaying stored results.
   */
  void setResumeHint(const std::vector<std::string> &processed);
  std::unordered_set<std::string> resumeHint() const;

  /**
   * @brief Claim the registered hint, leaving none behind
   */
  std::unordered_set<std::string> takeResumeHint();

private:
  void notifyLocked();

  const std::string id_;
  const std::string target_;
  const std::vector<std::string> items_;
  const std::unordered_set<std::string> item_set_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;

  types::SessionStatus status_ = types::SessionStatus::Pending;
  std::vector<types::WorkResult> results_;
  std::unordered_set<std::string> completed_;
  std::size_t current_batch_ = 0;
  std::size_t total_batches_ = 0;
  std::uint64_t version_ = 0;

  std::unordered_set<std::string> resume_hint_;
  const Clock::time_point created_at_;
  Clock::time_point last_activity_at_;
};

/**
 * @brief Owns all live sessions, keyed by session id
 */
class SessionRegistry {
public:
  struct Config {
    /**
     * @brief Sessions idle for longer than this are dropped by expire()
     */
    std::chrono::milliseconds session_expiry = std::chrono::minutes(30);
  };

  explicit SessionRegistry() : SessionRegistry(Config()) {}
  explicit SessionRegistry(const Config &config);

  /**
   * @brief Create a session in the Pending state
   *
   * @param target The target being investigated
   * @param items The reference items to check the target against
   * @param processed_hint Ids the client already holds
   * @return std::shared_ptr<SearchSession> The new session
   */
  std::shared_ptr<SearchSession>
  createSession(const std::string &target, std::vector<std::string> items,
                const std::vector<std::string> &processed_hint = {});

  /**
   * @brief Look up a session
   *
   * @return std::shared_ptr<SearchSession> The session, or nullptr if the id
   * is unknown or expired
   */
  std::shared_ptr<SearchSession> getSession(const std::string &session_id);

  /**
   * @brief Register a resume attempt for an existing session
   *
   * Touches the session and stores the processed hint.
   *
   * @return std::shared_ptr<SearchSession> The session, or nullptr if it does
   * not exist; the caller must then start over
   */
  std::shared_ptr<SearchSession>
  registerResume(const std::string &session_id, const std::string &target,
                 const std::vector<std::string> &processed_hint);

  /**
   * @brief Mark a session Cancelled
   *
   * @return true if the session existed and was not already terminal
   */
  bool cancel(const std::string &session_id);

  /**
   * @brief Drop sessions idle for longer than the configured expiry
   *
   * Non-terminal sessions are cancelled before removal.
   *
   * @param now The current time
   * @return std::size_t Number of dropped sessions
   */
  std::size_t expire(SearchSession::Clock::time_point now);

  std::size_t size() const;

  std::vector<std::string> sessionIds() const;

private:
  std::string generateSessionId();

  Config config_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<SearchSession>> sessions_;
  std::uint64_t session_counter_ = 0;
};

} // namespace server
} // namespace deepsearch

#endif // DEEPSEARCH_SERVER_SESSION_REGISTRY_HPP_
