#include "deepsearch/server/stream_transport.hpp"
#include "deepsearch/utils/error.hpp"
#include "deepsearch/utils/logging.hpp"

#include <algorithm>
#include <unordered_set>

namespace deepsearch {
namespace server {

namespace {

// Upper bound on a wait so a raised stop flag is noticed
constexpr std::chrono::milliseconds kStopCheckInterval{100};

} // namespace

SessionStream::SessionStream(SessionRegistry &registry,
                             BatchDispatcher *dispatcher, const Config &config)
    : registry_(registry), dispatcher_(dispatcher), config_(config) {}

SessionStream::Outcome SessionStream::run(EventWriter &writer,
                                          const std::string &session_id,
                                          std::optional<std::size_t> resume_count,
                                          const std::atomic<bool> *stop) {
  using Clock = std::chrono::steady_clock;

  auto session = registry_.getSession(session_id);
  if (!session) {
    DEEPSEARCH_LOG_WARNING("Stream requested for unknown session " +
                           session_id);
    auto ec = writer.write(toErrorEvent(SessionNotFoundException(session_id),
                                        true));
    if (ec) {
      DEEPSEARCH_LOG_DEBUG("Failed to send session-not-found error: " +
                           ec.message());
    }
    return Outcome::SessionNotFound;
  }

  session->touch();
  if (dispatcher_) {
    dispatcher_->start(session);
  }

  // Only a resuming connection claims the hint of the registration before it;
  // any other connection replays every stored result
  std::unordered_set<std::string> hint;
  if (resume_count) {
    hint = session->takeResumeHint();
  }
  if (resume_count && *resume_count != hint.size()) {
    DEEPSEARCH_LOG_WARNING("Session " + session_id + ": client reports " +
                           std::to_string(*resume_count) +
                           " processed items, registered hint has " +
                           std::to_string(hint.size()));
  }

  auto fail = [&](const std::error_code &ec) {
    DEEPSEARCH_LOG_INFO("Session " + session_id +
                        ": stream write failed: " + ec.message());
    return Outcome::WriteFailed;
  };

  const auto started = Clock::now();
  const auto age_deadline = started + config_.max_connection_age;
  auto next_heartbeat = started + config_.heartbeat_interval;

  auto snap = session->snapshot();
  types::InitEvent init;
  init.total = snap.total;
  init.progress = snap.completed;
  init.session_id = session_id;
  init.total_batches = snap.total_batches;
  if (auto ec = writer.write(init)) {
    return fail(ec);
  }

  DEEPSEARCH_LOG_INFO("Session " + session_id + ": stream opened, " +
                      std::to_string(snap.completed) + "/" +
                      std::to_string(snap.total) + " completed, " +
                      std::to_string(hint.size()) + " already processed");

  std::size_t cursor = 0;
  std::size_t last_batch = 0;

  while (true) {
    if (stop && *stop) {
      return Outcome::Stopped;
    }

    // Snapshot before reading results: a terminal status then implies every
    // result is already visible to resultsSince()
    snap = session->snapshot();
    auto fresh = session->resultsSince(cursor);
    cursor += fresh.size();

    if (snap.current_batch != last_batch) {
      last_batch = snap.current_batch;
      if (auto ec = writer.write(types::BatchInfoEvent{snap.current_batch,
                                                       snap.total_batches})) {
        return fail(ec);
      }
    }

    for (auto &result : fresh) {
      if (hint.count(result.item_id) != 0) {
        continue;
      }
      if (auto ec = writer.write(types::ResultEvent{std::move(result)})) {
        return fail(ec);
      }
    }

    if (snap.status == types::SessionStatus::Completed) {
      if (auto ec = writer.write(types::CompleteEvent{})) {
        return fail(ec);
      }
      DEEPSEARCH_LOG_INFO("Session " + session_id + ": stream complete");
      return Outcome::Completed;
    }

    if (snap.status == types::SessionStatus::Failed ||
        snap.status == types::SessionStatus::Cancelled) {
      types::ErrorEvent error;
      error.fatal = true;
      if (snap.status == types::SessionStatus::Cancelled) {
        error.message = "Session was cancelled";
        error.code = static_cast<int>(types::ErrorCode::Cancelled);
      } else {
        error.message = "Session failed";
        error.code = static_cast<int>(types::ErrorCode::InternalError);
      }
      if (auto ec = writer.write(error)) {
        return fail(ec);
      }
      return Outcome::Failed;
    }

    auto now = Clock::now();

    if (now >= age_deadline) {
      types::ReconnectWarningEvent warning;
      warning.session_id = session_id;
      warning.target = session->target();
      warning.completed_ids = session->completedIds();
      warning.resume_hint = warning.completed_ids.size();
      if (auto ec = writer.write(warning)) {
        return fail(ec);
      }
      DEEPSEARCH_LOG_INFO("Session " + session_id +
                          ": connection reached maximum age, reconnect "
                          "requested");
      return Outcome::ReconnectRequested;
    }

    if (now >= next_heartbeat) {
      types::HeartbeatEvent heartbeat;
      heartbeat.completed_ids = session->completedIds();
      heartbeat.progress = heartbeat.completed_ids.size();
      heartbeat.total = snap.total;
      if (auto ec = writer.write(heartbeat)) {
        return fail(ec);
      }
      session->touch();
      next_heartbeat = now + config_.heartbeat_interval;
    }

    auto wake = std::min(next_heartbeat, age_deadline);
    if (stop) {
      wake = std::min(wake, now + kStopCheckInterval);
    }
    session->waitForChange(snap.version, wake);
  }
}

std::string outcomeToString(SessionStream::Outcome outcome) {
  switch (outcome) {
  case SessionStream::Outcome::Completed:
    return "completed";
  case SessionStream::Outcome::Failed:
    return "failed";
  case SessionStream::Outcome::SessionNotFound:
    return "session not found";
  case SessionStream::Outcome::ReconnectRequested:
    return "reconnect requested";
  case SessionStream::Outcome::WriteFailed:
    return "write failed";
  case SessionStream::Outcome::Stopped:
    return "stopped";
  default:
    return "unknown";
  }
}

} // namespace server
} // namespace deepsearch
