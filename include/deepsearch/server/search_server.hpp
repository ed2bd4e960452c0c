#ifndef DEEPSEARCH_SERVER_SEARCH_SERVER_HPP_
#define DEEPSEARCH_SERVER_SEARCH_SERVER_HPP_

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "deepsearch/config.hpp"
#include "deepsearch/server/batch_dispatcher.hpp"
#include "deepsearch/server/fallback_poller.hpp"
#include "deepsearch/server/lookup_worker.hpp"
#include "deepsearch/server/session_registry.hpp"
#include "deepsearch/server/stream_transport.hpp"

namespace deepsearch {
namespace server {

namespace http = boost::beast::http;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

/**
 * @brief HTTP front end of the search service
 *
 * Routes:
 * - POST /search/session: create or resume a session
 * - GET /search/stream: SSE stream of session events
 * - GET /search/poll: one fallback poll
 * - GET /health: liveness and session count
 * - OPTIONS: CORS preflight
 *
 * Every connection is served by its own thread with blocking I/O and closed
 * after one request.
 */
class SearchServer {
public:
  /**
   * @param ioc I/O context owning the sockets
   * @param config Server configuration
   * @param worker Lookup worker for all sessions
   * @param items Reference list every session is checked against
   */
  SearchServer(boost::asio::io_context &ioc, const ServerConfig &config,
               std::shared_ptr<LookupWorker> worker,
               std::vector<std::string> items);

  ~SearchServer();

  SearchServer(const SearchServer &) = delete;
  SearchServer &operator=(const SearchServer &) = delete;

  /**
   * @brief Open the listening socket
   *
   * Called by run() when needed. With port 0 the bound port is available
   * from port() afterwards.
   *
   * @throws std::runtime_error if the address cannot be bound
   */
  void listen();

  /**
   * @brief Accept connections until stop() is called
   */
  void run();

  /**
   * @brief Stop accepting, end open streams and wait for all connections
   */
  void stop();

  unsigned short port() const;

  /**
   * @brief Produce the response for a non-streaming request
   *
   * @param req The request
   * @return http::response<http::string_body> The response
   */
  http::response<http::string_body>
  handleRequest(const http::request<http::string_body> &req);

  SessionRegistry &registry();

private:
  void handleConnection(tcp::socket socket);
  void handleStream(tcp::socket &socket,
                    const http::request<http::string_body> &req);

  http::response<http::string_body>
  handleSessionRequest(const http::request<http::string_body> &req);
  http::response<http::string_body>
  handlePollRequest(const http::request<http::string_body> &req);
  http::response<http::string_body>
  handleHealthRequest(const http::request<http::string_body> &req);

  void sweepLoop();

  boost::asio::io_context &ioc_;
  tcp::acceptor acceptor_;
  ServerConfig config_;
  std::vector<std::string> items_;

  SessionRegistry registry_;
  BatchDispatcher dispatcher_;
  SessionStream stream_;
  PollService poll_service_;

  std::atomic<bool> stopping_{false};
  std::atomic<bool> listening_{false};
  std::atomic<unsigned short> port_{0};

  std::mutex sweep_mutex_;
  std::condition_variable sweep_cv_;
  std::thread sweep_thread_;

  std::mutex connections_mutex_;
  std::condition_variable connections_cv_;
  std::size_t active_connections_ = 0;
};

} // namespace server
} // namespace deepsearch

#endif // DEEPSEARCH_SERVER_SEARCH_SERVER_HPP_
