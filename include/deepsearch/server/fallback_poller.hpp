#ifndef DEEPSEARCH_SERVER_FALLBACK_POLLER_HPP_
#define DEEPSEARCH_SERVER_FALLBACK_POLLER_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "deepsearch/server/batch_dispatcher.hpp"
#include "deepsearch/server/session_registry.hpp"
#include "deepsearch/types.hpp"

namespace deepsearch {
namespace server {

/**
 * @brief Serves the request/response path used when streaming is unavailable
 */
class PollService {
public:
  struct Config {
    /**
     * @brief Time one poll may spend waiting for results
     */
    std::chrono::milliseconds poll_timeout = std::chrono::seconds(25);

    /**
     * @brief Results a poll waits for before answering early
     */
    std::size_t poll_batch_size = 10;
  };

  /**
   * @param registry Sessions to serve
   * @param dispatcher Dispatcher running the sessions
   * @param items Reference items for sessions created by a poll
   * @param config Poll configuration
   */
  PollService(SessionRegistry &registry, BatchDispatcher &dispatcher,
              std::vector<std::string> items)
      : PollService(registry, dispatcher, std::move(items), Config()) {}
  PollService(SessionRegistry &registry, BatchDispatcher &dispatcher,
              std::vector<std::string> items, const Config &config);

  /**
   * @brief Run one poll
   *
   * @param target The target under investigation
   * @param session_id Session to poll; a new session is created when absent
   * @param processed_ids Ids the caller already holds
   * @return types::PollResponse Results the caller has not processed, plus
   * totals
   * @throws SessionNotFoundException if session_id names no live session
   * @throws DeepSearchException if the session was cancelled or failed
   */
  types::PollResponse poll(const std::string &target,
                           const std::optional<std::string> &session_id,
                           const std::vector<std::string> &processed_ids);

private:
  SessionRegistry &registry_;
  BatchDispatcher &dispatcher_;
  std::vector<std::string> items_;
  Config config_;
};

} // namespace server
} // namespace deepsearch

#endif // DEEPSEARCH_SERVER_FALLBACK_POLLER_HPP_
