#ifndef DEEPSEARCH_CLIENT_HTTP_SSE_CONNECTION_HPP_
#define DEEPSEARCH_CLIENT_HTTP_SSE_CONNECTION_HPP_

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include "deepsearch/client/sse_parser.hpp"
#include "deepsearch/client/stream_connection.hpp"

// Forward declaration for CURL
typedef void CURL;

namespace deepsearch {
namespace client {

/**
 * @brief Stream connection reading GET /search/stream with libcurl
 */
class HttpSseConnection : public StreamConnection {
public:
  struct Config {
    /**
     * @brief Server base URL, e.g. "http://127.0.0.1:5000"
     */
    std::string base_url;

    std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);
  };

  explicit HttpSseConnection(const Config &config);

  ~HttpSseConnection() override;

  void setEventCallback(
      std::function<void(types::StreamEvent)> callback) override;
  void setErrorCallback(std::function<void(std::error_code)> callback) override;
  void setCloseCallback(std::function<void()> callback) override;
  void setOpenCallback(std::function<void()> callback) override;

  void connect(const StreamRequest &request) override;
  void disconnect() override;
  bool isConnected() const override;

  /**
   * @brief Build the stream URL for a request
   */
  static std::string buildUrl(const std::string &base_url,
                              const StreamRequest &request);

private:
  static size_t writeCallback(char *ptr, size_t size, size_t nmemb,
                              void *userdata);

  void receiveThread(std::string url);
  void handleData(const std::string &chunk);
  void reportError(std::error_code error);

  Config config_;

  CURL *curl_ = nullptr;
  std::thread thread_;
  std::atomic<bool> connected_{false};
  std::atomic<bool> stopping_{false};
  bool opened_ = false;
  long http_status_ = 0;
  std::string error_body_;

  SseEventParser parser_;

  mutable std::mutex callback_mutex_;
  std::function<void(types::StreamEvent)> event_callback_;
  std::function<void(std::error_code)> error_callback_;
  std::function<void()> close_callback_;
  std::function<void()> open_callback_;
};

} // namespace client
} // namespace deepsearch

#endif // DEEPSEARCH_CLIENT_HTTP_SSE_CONNECTION_HPP_
