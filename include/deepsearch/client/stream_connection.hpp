#ifndef DEEPSEARCH_CLIENT_STREAM_CONNECTION_HPP_
#define DEEPSEARCH_CLIENT_STREAM_CONNECTION_HPP_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include "deepsearch/types.hpp"

namespace deepsearch {
namespace client {

/**
 * @brief Failures reported by stream connections
 */
enum class StreamError {
  ConnectFailed, ///< The server could not be reached
  HttpStatus,    ///< The server answered with a non-200 status
  Disconnected,  ///< The connection dropped mid-stream
  Timeout        ///< The connection timed out
};

const std::error_category &stream_category();

std::error_code make_error_code(StreamError e);

/**
 * @brief Parameters of one stream connection
 */
struct StreamRequest {
  std::string target;
  std::string session_id;
  std::optional<std::size_t> resume_count; ///< Items the client holds
};

/**
 * @brief Abstract server-to-client event stream
 *
 * Callbacks run on the connection's own thread. After disconnect() returns no
 * further callback is invoked.
 */
class StreamConnection {
public:
  virtual ~StreamConnection() = default;

  /**
   * @brief Set the callback for received events
   */
  virtual void
  setEventCallback(std::function<void(types::StreamEvent)> callback) = 0;

  /**
   * @brief Set the callback for connection errors
   */
  virtual void setErrorCallback(std::function<void(std::error_code)> callback) = 0;

  /**
   * @brief Set the callback for the end of the stream
   *
   * Invoked when the server closes the stream without an error.
   */
  virtual void setCloseCallback(std::function<void()> callback) = 0;

  /**
   * @brief Set the callback for the stream being accepted by the server
   */
  virtual void setOpenCallback(std::function<void()> callback) = 0;

  /**
   * @brief Open the stream; returns immediately
   *
   * @param request What to stream
   */
  virtual void connect(const StreamRequest &request) = 0;

  /**
   * @brief Close the stream and wait for its thread
   */
  virtual void disconnect() = 0;

  /**
   * @brief Check if the stream is open
   */
  virtual bool isConnected() const = 0;
};

/**
 * @brief Creates a fresh connection for every connect attempt
 */
using StreamConnectionFactory =
    std::function<std::unique_ptr<StreamConnection>()>;

} // namespace client
} // namespace deepsearch

namespace std {
template <>
struct is_error_code_enum<deepsearch::client::StreamError> : true_type {};
} // namespace std

#endif // DEEPSEARCH_CLIENT_STREAM_CONNECTION_HPP_
