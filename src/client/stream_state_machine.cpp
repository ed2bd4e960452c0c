#include "deepsearch/client/stream_state_machine.hpp"
#include "deepsearch/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace deepsearch {
namespace client {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::vector<std::string> processedIds(const ProgressState &progress) {
  std::vector<std::string> ids;
  ids.reserve(progress.processed.size());
  std::unordered_set<std::string> listed;
  for (const auto &result : progress.results) {
    ids.push_back(result.item_id);
    listed.insert(result.item_id);
  }
  // Ids from the caller's hint have no result object but still count
  for (const auto &id : progress.processed) {
    if (listed.count(id) == 0) {
      ids.push_back(id);
    }
  }
  return ids;
}

bool isStreaming(Phase phase) {
  return phase == Phase::Connecting || phase == Phase::Connected;
}

} // namespace

std::string phaseToString(Phase phase) {
  switch (phase) {
  case Phase::Disconnected:
    return "disconnected";
  case Phase::Connecting:
    return "connecting";
  case Phase::Connected:
    return "connected";
  case Phase::FallbackMode:
    return "fallback";
  case Phase::Closed:
    return "closed";
  default:
    return "unknown";
  }
}

std::string failureKindToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::SessionNotFound:
    return "session_not_found";
  case FailureKind::FallbackExhausted:
    return "fallback_exhausted";
  case FailureKind::ServerError:
    return "server_error";
  case FailureKind::Cancelled:
    return "cancelled";
  default:
    return "unknown";
  }
}

StreamStateMachine::StreamStateMachine() : StreamStateMachine(Config{}) {}

StreamStateMachine::StreamStateMachine(const Config &config)
    : config_(config) {}

const StreamStateMachine::Config &StreamStateMachine::config() const {
  return config_;
}

std::chrono::milliseconds
StreamStateMachine::backoff(int attempt, std::chrono::milliseconds base) const {
  const auto base_delay_ms = base.count();
  const auto max_delay_ms =
      std::max(base_delay_ms, config_.max_reconnect_backoff.count());

  double delay =
      std::min(static_cast<double>(max_delay_ms),
               base_delay_ms * std::pow(2.0, std::max(attempt, 1) - 1));

  if (config_.jitter > 0.0) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_real_distribution<> jitter(1.0 - config_.jitter,
                                            1.0 + config_.jitter);
    delay *= jitter(gen);
  }

  auto delay_ms = static_cast<long long>(delay);

  // Ensure delay is within bounds
  delay_ms = std::max<long long>(base_delay_ms,
                                 std::min<long long>(delay_ms, max_delay_ms));
  return std::chrono::milliseconds(delay_ms);
}

std::vector<Effect> StreamStateMachine::transition(MachineState &state,
                                                   const Input &in) const {
  std::vector<Effect> effects;
  auto &progress = state.progress;

  std::visit(
      overloaded{
          [&](const input::Start &start) {
            if (state.phase != Phase::Disconnected &&
                state.phase != Phase::Closed) {
              DEEPSEARCH_LOG_WARNING("Ignoring start while " +
                                     phaseToString(state.phase));
              return;
            }
            const auto generation = progress.generation;
            progress = ProgressState{};
            progress.generation = generation;
            progress.target = start.target;
            if (start.session_id) {
              progress.session_id = *start.session_id;
            }
            progress.processed.insert(start.processed_hint.begin(),
                                      start.processed_hint.end());
            connect(state, effects);
          },

          [&](const input::Registered &registered) {
            if (state.phase != Phase::Connecting || !progress.registering) {
              return;
            }
            progress.registering = false;
            progress.session_id = registered.session_id;
            ++progress.generation;

            effect::OpenStream open;
            open.target = progress.target;
            open.session_id = progress.session_id;
            if (!progress.processed.empty()) {
              open.resume_count = progress.processed.size();
            }
            open.generation = progress.generation;

            effects.push_back(std::move(open));
            effects.push_back(effect::ArmInactivityTimer{progress.generation});
            effects.push_back(
                effect::ArmConnectionAgeTimer{progress.generation});
          },

          [&](const input::RegistrationFailed &failed) {
            if (state.phase != Phase::Connecting || !progress.registering) {
              return;
            }
            progress.registering = false;
            if (failed.not_found) {
              fail(state, effects, FailureKind::SessionNotFound,
                   "Session " + progress.session_id +
                       " no longer exists on the server; start a new search",
                   false);
              return;
            }
            connectionFailed(state, effects,
                             "Session registration failed: " + failed.message);
          },

          [&](const input::StreamOpened &opened) {
            if (opened.generation != progress.generation ||
                state.phase != Phase::Connecting || progress.registering) {
              return;
            }
            state.phase = Phase::Connected;
            DEEPSEARCH_LOG_INFO("Stream connected for session " +
                                progress.session_id);
          },

          [&](const input::EventReceived &received) {
            if (received.generation != progress.generation ||
                !isStreaming(state.phase) || progress.registering) {
              return;
            }
            if (state.phase == Phase::Connecting) {
              state.phase = Phase::Connected;
            }
            handleEvent(state, received.event, effects);
          },

          [&](const input::TransportError &error) {
            if (error.generation != progress.generation ||
                !isStreaming(state.phase) || progress.registering) {
              return;
            }
            connectionFailed(state, effects, error.message);
          },

          [&](const input::StreamClosed &closed) {
            if (closed.generation != progress.generation ||
                !isStreaming(state.phase) || progress.registering) {
              return;
            }
            connectionFailed(state, effects,
                             "Stream ended before the search completed");
          },

          [&](const input::InactivityTimeout &timeout) {
            if (timeout.generation != progress.generation ||
                !isStreaming(state.phase) || progress.registering) {
              return;
            }
            connectionFailed(state, effects, "No event received in time");
          },

          [&](const input::ConnectionAgeExpired &expired) {
            if (expired.generation != progress.generation ||
                !isStreaming(state.phase) || progress.registering) {
              return;
            }
            plannedReconnect(state, effects, "Connection reached its maximum age");
          },

          [&](const input::BackoffElapsed &) {
            if (state.phase != Phase::Disconnected) {
              return;
            }
            connect(state, effects);
          },

          [&](const input::PollDue &) {
            if (state.phase != Phase::FallbackMode) {
              return;
            }
            effects.push_back(effect::IssuePoll{
                progress.target, progress.session_id, processedIds(progress)});
          },

          [&](const input::PollSucceeded &succeeded) {
            if (state.phase != Phase::FallbackMode) {
              return;
            }
            const auto &response = succeeded.response;
            progress.poll_failures = 0;
            if (progress.session_id.empty() && !response.session_id.empty()) {
              progress.session_id = response.session_id;
            }
            progress.total = response.total;
            progress.total_known = true;
            progress.server_progress =
                std::max(progress.server_progress, response.processed);

            for (const auto &result : response.results) {
              applyResult(state, result, effects);
            }
            reportProgress(state, effects);

            if (progress.processed.size() >= progress.total) {
              DEEPSEARCH_LOG_INFO("Fallback polling finished with " +
                                  std::to_string(progress.results.size()) +
                                  " results");
              close(state, effects);
              effects.push_back(effect::ReportComplete{progress.results});
              return;
            }
            effects.push_back(effect::SchedulePoll{config_.poll_interval});
          },

          [&](const input::PollFailed &failed) {
            if (state.phase != Phase::FallbackMode) {
              return;
            }
            if (failed.not_found) {
              fail(state, effects, FailureKind::SessionNotFound,
                   "Session " + progress.session_id +
                       " no longer exists on the server; start a new search",
                   false);
              return;
            }
            ++progress.poll_failures;
            DEEPSEARCH_LOG_WARNING("Poll failed (" +
                                   std::to_string(progress.poll_failures) + "/" +
                                   std::to_string(config_.max_poll_failures) +
                                   "): " + failed.message);
            if (progress.poll_failures >= config_.max_poll_failures) {
              fail(state, effects, FailureKind::FallbackExhausted,
                   "Lost contact with the server: " + failed.message, true);
              return;
            }
            effects.push_back(effect::SchedulePoll{
                backoff(progress.poll_failures, config_.poll_retry_delay)});
          },

          [&](const input::Cancel &) {
            if (state.phase == Phase::Closed) {
              return;
            }
            close(state, effects);
            const auto generation = progress.generation;
            progress = ProgressState{};
            progress.generation = generation;
          },
      },
      in);

  return effects;
}

void StreamStateMachine::connect(MachineState &state,
                                 std::vector<Effect> &effects) const {
  auto &progress = state.progress;
  state.phase = Phase::Connecting;
  progress.registering = true;

  effect::RegisterSession registration;
  registration.target = progress.target;
  if (!progress.session_id.empty()) {
    registration.session_id = progress.session_id;
  }
  registration.processed = processedIds(progress);
  effects.push_back(std::move(registration));
}

void StreamStateMachine::plannedReconnect(MachineState &state,
                                          std::vector<Effect> &effects,
                                          const std::string &reason) const {
  DEEPSEARCH_LOG_INFO(reason + "; reconnecting session " +
                      state.progress.session_id + " with " +
                      std::to_string(state.progress.processed.size()) +
                      " processed items");
  ++state.progress.generation;
  effects.push_back(effect::CloseStream{});
  effects.push_back(effect::CancelTimers{});
  connect(state, effects);
}

void StreamStateMachine::connectionFailed(MachineState &state,
                                          std::vector<Effect> &effects,
                                          const std::string &reason) const {
  auto &progress = state.progress;
  ++progress.generation;
  ++progress.reconnect_attempts;
  effects.push_back(effect::CloseStream{});
  effects.push_back(effect::CancelTimers{});

  if (progress.reconnect_attempts >= config_.max_reconnect_attempts) {
    DEEPSEARCH_LOG_WARNING(reason + "; giving up on streaming after " +
                           std::to_string(progress.reconnect_attempts) +
                           " attempts");
    enterFallback(state, effects);
    return;
  }

  const auto delay =
      backoff(progress.reconnect_attempts, config_.reconnect_delay);
  DEEPSEARCH_LOG_WARNING(reason + "; reconnect attempt " +
                         std::to_string(progress.reconnect_attempts) + " in " +
                         std::to_string(delay.count()) + "ms");
  state.phase = Phase::Disconnected;
  effects.push_back(effect::ScheduleReconnect{delay});
}

void StreamStateMachine::enterFallback(MachineState &state,
                                       std::vector<Effect> &effects) const {
  auto &progress = state.progress;
  state.phase = Phase::FallbackMode;
  progress.poll_failures = 0;
  effects.push_back(effect::IssuePoll{progress.target, progress.session_id,
                                      processedIds(progress)});
}

void StreamStateMachine::close(MachineState &state,
                               std::vector<Effect> &effects) const {
  ++state.progress.generation;
  state.progress.registering = false;
  state.phase = Phase::Closed;
  effects.push_back(effect::CloseStream{});
  effects.push_back(effect::CancelTimers{});
}

void StreamStateMachine::fail(MachineState &state,
                              std::vector<Effect> &effects, FailureKind kind,
                              const std::string &message,
                              bool recoverable) const {
  DEEPSEARCH_LOG_ERROR("Search failed (" + failureKindToString(kind) +
                       "): " + message);
  close(state, effects);
  effects.push_back(effect::ReportError{kind, message, recoverable});
}

bool StreamStateMachine::applyResult(MachineState &state,
                                     const types::WorkResult &result,
                                     std::vector<Effect> &effects) const {
  auto &progress = state.progress;
  if (!progress.processed.insert(result.item_id).second) {
    DEEPSEARCH_LOG_DEBUG("Discarding duplicate result for " + result.item_id);
    return false;
  }
  progress.results.push_back(result);
  progress.reconnect_attempts = 0;
  effects.push_back(effect::DeliverResult{result});
  return true;
}

void StreamStateMachine::reportProgress(const MachineState &state,
                                        std::vector<Effect> &effects) const {
  const auto &progress = state.progress;
  effects.push_back(effect::ReportProgress{
      std::max(progress.processed.size(), progress.server_progress),
      progress.total});
}

void StreamStateMachine::handleEvent(MachineState &state,
                                     const types::StreamEvent &event,
                                     std::vector<Effect> &effects) const {
  auto &progress = state.progress;

  // Any event proves the connection alive
  auto rearm = [&]() {
    effects.push_back(effect::ArmInactivityTimer{progress.generation});
  };

  std::visit(
      overloaded{
          [&](const types::InitEvent &init) {
            progress.total = init.total;
            progress.total_known = true;
            progress.server_progress =
                std::max(progress.server_progress, init.progress);
            if (!init.session_id.empty()) {
              progress.session_id = init.session_id;
            }
            rearm();
            reportProgress(state, effects);
          },

          [&](const types::BatchInfoEvent &batch) {
            DEEPSEARCH_LOG_DEBUG("Server processing batch " +
                                 std::to_string(batch.current_batch) + "/" +
                                 std::to_string(batch.total_batches));
            rearm();
          },

          [&](const types::HeartbeatEvent &heartbeat) {
            if (heartbeat.total > 0) {
              progress.total = heartbeat.total;
              progress.total_known = true;
            }
            progress.server_progress =
                std::max(progress.server_progress, heartbeat.progress);

            std::size_t missing = 0;
            for (const auto &id : heartbeat.completed_ids) {
              if (progress.processed.count(id) == 0) {
                ++missing;
              }
            }
            if (missing > 0) {
              DEEPSEARCH_LOG_DEBUG(std::to_string(missing) +
                                   " completed items not received yet");
            }
            rearm();
            reportProgress(state, effects);
          },

          [&](const types::ResultEvent &result) {
            rearm();
            if (applyResult(state, result.result, effects)) {
              reportProgress(state, effects);
            }
          },

          [&](const types::ReconnectWarningEvent &warning) {
            if (!warning.session_id.empty()) {
              progress.session_id = warning.session_id;
            }
            progress.server_progress =
                std::max(progress.server_progress, warning.resume_hint);
            plannedReconnect(state, effects,
                             "Server requested a reconnect");
          },

          [&](const types::ErrorEvent &error) {
            if (!error.fatal) {
              DEEPSEARCH_LOG_WARNING("Server reported: " + error.message);
              rearm();
              return;
            }
            switch (static_cast<types::ErrorCode>(error.code)) {
            case types::ErrorCode::SessionNotFound:
              fail(state, effects, FailureKind::SessionNotFound,
                   "Session " + progress.session_id +
                       " no longer exists on the server; start a new search",
                   false);
              break;
            case types::ErrorCode::Cancelled:
              fail(state, effects, FailureKind::Cancelled, error.message,
                   false);
              break;
            default:
              fail(state, effects, FailureKind::ServerError, error.message,
                   false);
              break;
            }
          },

          [&](const types::CompleteEvent &) {
            DEEPSEARCH_LOG_INFO("Search completed with " +
                                std::to_string(progress.results.size()) +
                                " results");
            close(state, effects);
            effects.push_back(effect::ReportComplete{progress.results});
          },
      },
      event);
}

} // namespace client
} // namespace deepsearch
