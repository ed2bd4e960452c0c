#ifndef DEEPSEARCH_CLIENT_STREAM_STATE_MACHINE_HPP_
#define DEEPSEARCH_CLIENT_STREAM_STATE_MACHINE_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

#include "deepsearch/types.hpp"

namespace deepsearch {
namespace client {

/**
 * @brief Connection phase of a client stream
 */
enum class Phase {
  Disconnected, ///< Waiting for the next reconnect attempt
  Connecting,   ///< Registering or opening a stream
  Connected,    ///< Stream accepted by the server
  FallbackMode, ///< Streaming gave up; polling instead
  Closed        ///< Finished, failed or cancelled
};

std::string phaseToString(Phase phase);

/**
 * @brief Failures surfaced to the consumer
 */
enum class FailureKind {
  SessionNotFound,   ///< The server lost the session; start a new search
  FallbackExhausted, ///< Polling failed too often; the search may be retried
  ServerError,       ///< The server ended the stream with a fatal error
  Cancelled          ///< The server cancelled the session
};

std::string failureKindToString(FailureKind kind);

/**
 * @brief Everything the client knows about one search
 */
struct ProgressState {
  std::string target;
  std::string session_id;                  ///< Empty until registered
  std::unordered_set<std::string> processed; ///< Ids already delivered
  std::vector<types::WorkResult> results;    ///< Delivered results in order
  std::size_t total = 0;
  bool total_known = false;
  std::size_t server_progress = 0; ///< Last progress reported by the server
  int reconnect_attempts = 0;      ///< Consecutive unplanned disconnects
  int poll_failures = 0;           ///< Consecutive failed polls
  std::uint64_t generation = 0;    ///< Id of the current stream connection
  bool registering = false;        ///< A RegisterSession effect is in flight
};

struct MachineState {
  Phase phase = Phase::Disconnected;
  ProgressState progress;
};

namespace input {

struct Start {
  std::string target;
  std::optional<std::string> session_id;
  std::vector<std::string> processed_hint;
};
struct Registered {
  std::string session_id;
};
struct RegistrationFailed {
  bool not_found = false;
  std::string message;
};
struct StreamOpened {
  std::uint64_t generation = 0;
};
struct EventReceived {
  std::uint64_t generation = 0;
  types::StreamEvent event;
};
struct TransportError {
  std::uint64_t generation = 0;
  std::string message;
};
struct StreamClosed {
  std::uint64_t generation = 0;
};
struct InactivityTimeout {
  std::uint64_t generation = 0;
};
struct ConnectionAgeExpired {
  std::uint64_t generation = 0;
};
struct BackoffElapsed {};
struct PollDue {};
struct PollSucceeded {
  types::PollResponse response;
};
struct PollFailed {
  bool not_found = false;
  std::string message;
};
struct Cancel {};

} // namespace input

using Input =
    std::variant<input::Start, input::Registered, input::RegistrationFailed,
                 input::StreamOpened, input::EventReceived,
                 input::TransportError, input::StreamClosed,
                 input::InactivityTimeout, input::ConnectionAgeExpired,
                 input::BackoffElapsed, input::PollDue, input::PollSucceeded,
                 input::PollFailed, input::Cancel>;

namespace effect {

struct RegisterSession {
  std::string target;
  std::optional<std::string> session_id;
  std::vector<std::string> processed;
};
struct OpenStream {
  std::string target;
  std::string session_id;
  std::optional<std::size_t> resume_count;
  std::uint64_t generation = 0;
};
struct CloseStream {};
struct ArmInactivityTimer {
  std::uint64_t generation = 0;
};
struct ArmConnectionAgeTimer {
  std::uint64_t generation = 0;
};
struct CancelTimers {};
struct ScheduleReconnect {
  std::chrono::milliseconds delay{0};
};
struct IssuePoll {
  std::string target;
  std::string session_id;
  std::vector<std::string> processed;
};
struct SchedulePoll {
  std::chrono::milliseconds delay{0};
};
struct DeliverResult {
  types::WorkResult result;
};
struct ReportProgress {
  std::size_t processed = 0;
  std::size_t total = 0;
};
struct ReportComplete {
  std::vector<types::WorkResult> results;
};
struct ReportError {
  FailureKind kind = FailureKind::ServerError;
  std::string message;
  bool recoverable = false;
};

} // namespace effect

using Effect =
    std::variant<effect::RegisterSession, effect::OpenStream,
                 effect::CloseStream, effect::ArmInactivityTimer,
                 effect::ArmConnectionAgeTimer, effect::CancelTimers,
                 effect::ScheduleReconnect, effect::IssuePoll,
                 effect::SchedulePoll, effect::DeliverResult,
                 effect::ReportProgress, effect::ReportComplete,
                 effect::ReportError>;

/**
 * @brief Reconnect and fallback logic of a client stream
 *
 * transition() only reads its configuration and the state passed in; all I/O
 * and timers are requested through the returned effects, which the caller
 * executes in order.
 */
class StreamStateMachine {
public:
  struct Config {
    /**
     * @brief Unplanned disconnects tolerated before falling back to polling
     */
    int max_reconnect_attempts = 5;

    std::chrono::milliseconds reconnect_delay = std::chrono::seconds(1);
    std::chrono::milliseconds max_reconnect_backoff = std::chrono::seconds(30);

    /**
     * @brief Pause between successful polls while items remain
     */
    std::chrono::milliseconds poll_interval = std::chrono::seconds(1);

    /**
     * @brief Base delay for retrying a failed poll
     */
    std::chrono::milliseconds poll_retry_delay = std::chrono::seconds(1);

    int max_poll_failures = 5;

    /**
     * @brief Relative jitter applied to backoff delays, 0.2 means ±20%
     */
    double jitter = 0.2;
  };

  StreamStateMachine();
  explicit StreamStateMachine(const Config &config);

  /**
   * @brief Apply one input to the state
   *
   * @param state State to update
   * @param in The input
   * @return std::vector<Effect> Effects to execute, in order
   */
  std::vector<Effect> transition(MachineState &state, const Input &in) const;

  /**
   * @brief Exponential backoff for the given attempt, capped and jittered
   *
   * @param attempt 1-based attempt number
   * @param base Delay of the first attempt
   */
  std::chrono::milliseconds backoff(int attempt,
                                    std::chrono::milliseconds base) const;

  const Config &config() const;

private:
  void connect(MachineState &state, std::vector<Effect> &effects) const;
  void plannedReconnect(MachineState &state, std::vector<Effect> &effects,
                        const std::string &reason) const;
  void connectionFailed(MachineState &state, std::vector<Effect> &effects,
                        const std::string &reason) const;
  void enterFallback(MachineState &state, std::vector<Effect> &effects) const;
  void close(MachineState &state, std::vector<Effect> &effects) const;
  void fail(MachineState &state, std::vector<Effect> &effects,
            FailureKind kind, const std::string &message,
            bool recoverable) const;
  bool applyResult(MachineState &state, const types::WorkResult &result,
                   std::vector<Effect> &effects) const;
  void reportProgress(const MachineState &state,
                      std::vector<Effect> &effects) const;
  void handleEvent(MachineState &state, const types::StreamEvent &event,
                   std::vector<Effect> &effects) const;

  Config config_;
};

} // namespace client
} // namespace deepsearch

#endif // DEEPSEARCH_CLIENT_STREAM_STATE_MACHINE_HPP_
