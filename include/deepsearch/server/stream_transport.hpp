#ifndef DEEPSEARCH_SERVER_STREAM_TRANSPORT_HPP_
#define DEEPSEARCH_SERVER_STREAM_TRANSPORT_HPP_

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <system_error>

#include "deepsearch/server/batch_dispatcher.hpp"
#include "deepsearch/server/session_registry.hpp"
#include "deepsearch/types.hpp"

namespace deepsearch {
namespace server {

/**
 * @brief Sink for the events of one stream connection
 */
class EventWriter {
public:
  virtual ~EventWriter() = default;

  /**
   * @brief Write one event
   *
   * @param event The event
   * @return std::error_code Empty on success
   */
  virtual std::error_code write(const types::StreamEvent &event) = 0;
};

/**
 * @brief Pushes the events of a session to one connection
 *
 * A connection starts with Init, replays the stored results the client did
 * not report as processed, then follows the session live. It ends on a
 * terminal status, on a write failure, or with a ReconnectWarning once it
 * reaches the maximum connection age.
 */
class SessionStream {
public:
  struct Config {
    /**
     * @brief Interval between heartbeats, independent of result arrival
     */
    std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(5);

    /**
     * @brief Age at which the connection is ended with a ReconnectWarning;
     * must stay below the platform connection-duration ceiling
     */
    std::chrono::milliseconds max_connection_age = std::chrono::seconds(240);
  };

  /**
   * @brief How a connection ended
   */
  enum class Outcome {
    Completed,          ///< Complete was sent
    Failed,             ///< Session failed or was cancelled; fatal Error sent
    SessionNotFound,    ///< Unknown session; fatal Error sent
    ReconnectRequested, ///< ReconnectWarning sent
    WriteFailed,        ///< The writer reported an error
    Stopped             ///< The stop flag was raised
  };

  /**
   * @param registry Sessions to serve
   * @param dispatcher Started for the session on connect; may be null
   * @param config Stream configuration
   */
  SessionStream(SessionRegistry &registry, BatchDispatcher *dispatcher)
      : SessionStream(registry, dispatcher, Config()) {}
  SessionStream(SessionRegistry &registry, BatchDispatcher *dispatcher,
                const Config &config);

  /**
   * @brief Serve one connection until it ends
   *
   * @param writer Destination of the events
   * @param session_id Session to follow
   * @param resume_count Count the client reported as processed. When
   * present the connection claims the hint registered before it, and the
   * count is compared with that hint and logged; when absent every stored
   * result is replayed
   * @param stop Optional flag ending the connection early
   * @return Outcome How the connection ended
   */
  Outcome run(EventWriter &writer, const std::string &session_id,
              std::optional<std::size_t> resume_count = std::nullopt,
              const std::atomic<bool> *stop = nullptr);

private:
  SessionRegistry &registry_;
  BatchDispatcher *dispatcher_;
  Config config_;
};

std::string outcomeToString(SessionStream::Outcome outcome);

} // namespace server
} // namespace deepsearch

#endif // DEEPSEARCH_SERVER_STREAM_TRANSPORT_HPP_
