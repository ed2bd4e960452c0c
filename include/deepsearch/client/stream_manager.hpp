#ifndef DEEPSEARCH_CLIENT_STREAM_MANAGER_HPP_
#define DEEPSEARCH_CLIENT_STREAM_MANAGER_HPP_

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "deepsearch/client/search_api.hpp"
#include "deepsearch/client/stream_connection.hpp"
#include "deepsearch/client/stream_state_machine.hpp"

namespace deepsearch {
namespace client {

/**
 * @brief Client side of one resumable search
 *
 * Runs a StreamStateMachine on its own event-loop thread. Stream connections
 * call back on their own threads and registration and polls run on a helper
 * thread; all of them post inputs into the loop, which is the only writer of
 * the search state. Consumer callbacks run on the loop thread.
 */
class StreamManager {
public:
  struct Config {
    StreamStateMachine::Config machine;

    /**
     * @brief Silence on an open stream after which it counts as dead
     */
    std::chrono::milliseconds inactivity_timeout = std::chrono::seconds(60);

    /**
     * @brief Age after which the client reconnects on its own
     */
    std::chrono::milliseconds max_connection_age = std::chrono::seconds(285);
  };

  using ResultCallback = std::function<void(const types::WorkResult &)>;
  using ProgressCallback =
      std::function<void(std::size_t processed, std::size_t total)>;
  using CompleteCallback =
      std::function<void(const std::vector<types::WorkResult> &)>;
  using ErrorCallback = std::function<void(
      FailureKind kind, const std::string &message, bool recoverable)>;
  using PhaseCallback = std::function<void(Phase)>;

  StreamManager(std::shared_ptr<SearchApi> api,
                StreamConnectionFactory connection_factory,
                const Config &config);

  ~StreamManager();

  StreamManager(const StreamManager &) = delete;
  StreamManager &operator=(const StreamManager &) = delete;

  void setResultCallback(ResultCallback callback);
  void setProgressCallback(ProgressCallback callback);
  void setCompleteCallback(CompleteCallback callback);
  void setErrorCallback(ErrorCallback callback);
  void setPhaseCallback(PhaseCallback callback);

  /**
   * @brief Start or resume a search
   *
   * @param target Search target
   * @param session_id Session to resume; absent starts a fresh session
   * @param processed_hint Ids the caller already holds from earlier runs
   */
  void start(const std::string &target,
             const std::optional<std::string> &session_id = std::nullopt,
             const std::vector<std::string> &processed_hint = {});

  /**
   * @brief Stop the search; no callback fires after this returns
   */
  void cancel();

  Phase phase() const;

  /**
   * @brief Wait for the search to finish, fail or be cancelled
   *
   * @return true if the manager reached the closed phase in time
   */
  bool waitUntilClosed(std::chrono::milliseconds timeout) const;

  std::vector<types::WorkResult> results() const;

  std::string sessionId() const;

private:
  enum TimerKind {
    kInactivity = 0,
    kConnectionAge,
    kReconnect,
    kPoll,
    kTimerCount
  };

  struct Timer {
    std::chrono::steady_clock::time_point due;
    Input input;
  };

  void post(Input in);
  void postIo(std::function<void()> job);

  void eventLoop();
  void ioLoop();
  void handle(const Input &in);
  void execute(const Effect &action);
  void openStream(const effect::OpenStream &open);
  void closeStream();
  void setTimer(TimerKind kind, std::chrono::milliseconds delay, Input in);
  template <typename Callback, typename... Args>
  void deliver(Callback StreamManager::*member, Args &&...args);

  std::shared_ptr<SearchApi> api_;
  StreamConnectionFactory connection_factory_;
  Config config_;
  StreamStateMachine machine_;

  // Loop-thread only
  std::unique_ptr<StreamConnection> connection_;

  mutable std::mutex state_mutex_;
  mutable std::condition_variable closed_cv_;
  MachineState state_;
  bool closed_ = false; ///< Closed and every effect of the last input executed

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<Input> inputs_;
  std::array<std::optional<Timer>, kTimerCount> timers_;
  bool stopping_ = false;

  std::mutex io_mutex_;
  std::condition_variable io_cv_;
  std::deque<std::function<void()>> io_jobs_;
  bool io_stopping_ = false;

  std::atomic<bool> cancelled_{false};
  std::mutex delivery_mutex_; ///< Held while a consumer callback runs

  std::mutex callback_mutex_;
  ResultCallback result_callback_;
  ProgressCallback progress_callback_;
  CompleteCallback complete_callback_;
  ErrorCallback error_callback_;
  PhaseCallback phase_callback_;

  std::thread loop_thread_;
  std::thread io_thread_;
};

} // namespace client
} // namespace deepsearch

#endif // DEEPSEARCH_CLIENT_STREAM_MANAGER_HPP_
