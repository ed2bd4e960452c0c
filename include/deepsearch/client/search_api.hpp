#ifndef DEEPSEARCH_CLIENT_SEARCH_API_HPP_
#define DEEPSEARCH_CLIENT_SEARCH_API_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "deepsearch/types.hpp"

namespace deepsearch {
namespace client {

/**
 * @brief Request/response calls a client makes besides the event stream
 *
 * Implementations throw SessionNotFoundException when the server does not know
 * the session, and another DeepSearchException for any other failure.
 */
class SearchApi {
public:
  virtual ~SearchApi() = default;

  /**
   * @brief Register a new session or a resume attempt
   *
   * @param request Target, optional session id and the ids already processed
   * @return std::string The session id to stream from
   */
  virtual std::string registerSession(const types::SessionRequest &request) = 0;

  /**
   * @brief Fetch results the caller has not processed yet
   *
   * @param target Search target
   * @param session_id Session to poll; empty creates a session
   * @param processed Ids the caller already holds
   */
  virtual types::PollResponse
  poll(const std::string &target, const std::string &session_id,
       const std::vector<std::string> &processed) = 0;
};

/**
 * @brief SearchApi over HTTP using libcurl
 */
class CurlSearchApi : public SearchApi {
public:
  struct Config {
    std::string base_url = "http://127.0.0.1:5000";
    std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);

    /**
     * @brief Total request timeout; must exceed the server's poll window
     */
    std::chrono::milliseconds request_timeout = std::chrono::seconds(30);
  };

  explicit CurlSearchApi(const Config &config);

  std::string registerSession(const types::SessionRequest &request) override;

  types::PollResponse poll(const std::string &target,
                           const std::string &session_id,
                           const std::vector<std::string> &processed) override;

private:
  struct Reply {
    long status = 0;
    std::string body;
  };

  Reply perform(const std::string &url, const std::string *post_body) const;

  Config config_;
};

} // namespace client
} // namespace deepsearch

#endif // DEEPSEARCH_CLIENT_SEARCH_API_HPP_
