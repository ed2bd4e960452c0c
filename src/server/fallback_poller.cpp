#include "deepsearch/server/fallback_poller.hpp"
#include "deepsearch/utils/error.hpp"
#include "deepsearch/utils/logging.hpp"

#include <unordered_set>

namespace deepsearch {
namespace server {

PollService::PollService(SessionRegistry &registry, BatchDispatcher &dispatcher,
                         std::vector<std::string> items, const Config &config)
    : registry_(registry), dispatcher_(dispatcher), items_(std::move(items)),
      config_(config) {}

types::PollResponse
PollService::poll(const std::string &target,
                  const std::optional<std::string> &session_id,
                  const std::vector<std::string> &processed_ids) {
  std::shared_ptr<SearchSession> session;
  if (session_id && !session_id->empty()) {
    session = registry_.getSession(*session_id);
    if (!session) {
      throw SessionNotFoundException(*session_id);
    }
    session->touch();
  } else {
    session = registry_.createSession(target, items_, processed_ids);
  }

  std::unordered_set<std::string> known(processed_ids.begin(),
                                        processed_ids.end());

  auto deadline = std::chrono::steady_clock::now() + config_.poll_timeout;
  auto results =
      dispatcher_.runFor(session, known, deadline, config_.poll_batch_size);

  auto snap = session->snapshot();
  if (snap.status == types::SessionStatus::Cancelled) {
    throw DeepSearchException(types::ErrorCode::Cancelled,
                              "Session was cancelled: " + session->id());
  }
  if (snap.status == types::SessionStatus::Failed) {
    throw DeepSearchException(types::ErrorCode::InternalError,
                              "Session failed: " + session->id());
  }

  types::PollResponse response;
  response.results = std::move(results);
  response.processed = snap.completed;
  response.total = snap.total;
  response.session_id = session->id();

  DEEPSEARCH_LOG_DEBUG("Poll of session " + response.session_id + ": " +
                       std::to_string(response.results.size()) +
                       " new results, " + std::to_string(response.processed) +
                       "/" + std::to_string(response.total) + " completed");
  return response;
}

} // namespace server
} // namespace deepsearch
