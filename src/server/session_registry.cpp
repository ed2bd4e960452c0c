#include "deepsearch/server/session_registry.hpp"
#include "deepsearch/utils/logging.hpp"

#include <random>
#include <sstream>

namespace deepsearch {
namespace server {

namespace {

int statusRank(types::SessionStatus status) {
  switch (status) {
  case types::SessionStatus::Pending:
    return 0;
  case types::SessionStatus::Running:
    return 1;
  default:
    return 2;
  }
}

// Duplicate entries would never all complete, so keep the first of each
std::vector<std::string> uniqueItems(std::vector<std::string> items) {
  std::unordered_set<std::string> seen;
  std::vector<std::string> unique;
  unique.reserve(items.size());
  for (auto &item : items) {
    if (seen.insert(item).second) {
      unique.push_back(std::move(item));
    }
  }
  return unique;
}

} // namespace

SearchSession::SearchSession(std::string id, std::string target,
                             std::vector<std::string> items)
    : id_(std::move(id)), target_(std::move(target)),
      items_(uniqueItems(std::move(items))),
      item_set_(items_.begin(), items_.end()), created_at_(Clock::now()),
      last_activity_at_(created_at_) {}

const std::string &SearchSession::id() const { return id_; }

const std::string &SearchSession::target() const { return target_; }

const std::vector<std::string> &SearchSession::items() const { return items_; }

types::SessionStatus SearchSession::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

bool SearchSession::advanceStatus(types::SessionStatus next) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (statusRank(next) <= statusRank(status_)) {
    return false;
  }

  DEEPSEARCH_LOG_DEBUG("Session " + id_ + ": " +
                       types::sessionStatusToString(status_) + " -> " +
                       types::sessionStatusToString(next));
  status_ = next;
  notifyLocked();
  return true;
}

bool SearchSession::recordResult(const types::WorkResult &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (types::isTerminal(status_)) {
    DEEPSEARCH_LOG_DEBUG("Session " + id_ + ": dropping result for " +
                         result.item_id + " after " +
                         types::sessionStatusToString(status_));
    return false;
  }
  if (item_set_.count(result.item_id) == 0) {
    DEEPSEARCH_LOG_WARNING("Session " + id_ + ": result for unknown item " +
                           result.item_id);
    return false;
  }
  if (!completed_.insert(result.item_id).second) {
    return false;
  }

  results_.push_back(result);
  notifyLocked();
  return true;
}

void SearchSession::setBatchProgress(std::size_t current_batch,
                                     std::size_t total_batches) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_batch_ = current_batch;
  total_batches_ = total_batches;
  notifyLocked();
}

std::vector<std::string> SearchSession::pendingItems() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> pending;
  for (const auto &item : items_) {
    if (completed_.count(item) == 0) {
      pending.push_back(item);
    }
  }
  return pending;
}

std::vector<std::string> SearchSession::completedIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(results_.size());
  for (const auto &result : results_) {
    ids.push_back(result.item_id);
  }
  return ids;
}

std::vector<types::WorkResult>
SearchSession::resultsSince(std::size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= results_.size()) {
    return {};
  }
  return std::vector<types::WorkResult>(
      results_.begin() + static_cast<std::ptrdiff_t>(index), results_.end());
}

std::size_t SearchSession::completedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return results_.size();
}

SearchSession::Snapshot SearchSession::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snap;
  snap.status = status_;
  snap.total = items_.size();
  snap.completed = results_.size();
  snap.current_batch = current_batch_;
  snap.total_batches = total_batches_;
  snap.version = version_;
  return snap;
}

bool SearchSession::waitForChange(std::uint64_t seen_version,
                                  Clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_until(lock, deadline,
                        [&] { return version_ != seen_version; });
}

void SearchSession::touch() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_activity_at_ = Clock::now();
}

SearchSession::Clock::time_point SearchSession::createdAt() const {
  return created_at_;
}

SearchSession::Clock::time_point SearchSession::lastActivityAt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_activity_at_;
}

void SearchSession::setResumeHint(const std::vector<std::string> &processed) {
  std::lock_guard<std::mutex> lock(mutex_);
  resume_hint_ =
      std::unordered_set<std::string>(processed.begin(), processed.end());
}

std::unordered_set<std::string> SearchSession::resumeHint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resume_hint_;
}

std::unordered_set<std::string> SearchSession::takeResumeHint() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_set<std::string> hint;
  hint.swap(resume_hint_);
  return hint;
}

void SearchSession::notifyLocked() {
  ++version_;
  cv_.notify_all();
}

SessionRegistry::SessionRegistry(const Config &config) : config_(config) {}

std::shared_ptr<SearchSession>
SessionRegistry::createSession(const std::string &target,
                               std::vector<std::string> items,
                               const std::vector<std::string> &processed_hint) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::string id = generateSessionId();
  while (sessions_.count(id) != 0) {
    id = generateSessionId();
  }

  auto session = std::make_shared<SearchSession>(id, target, std::move(items));
  if (!processed_hint.empty()) {
    session->setResumeHint(processed_hint);
  }
  sessions_[id] = session;

  DEEPSEARCH_LOG_INFO("Created session " + id + " for \"" + target +
                      "\" with " + std::to_string(session->items().size()) +
                      " items");
  return session;
}

std::shared_ptr<SearchSession>
SessionRegistry::getSession(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<SearchSession>
SessionRegistry::registerResume(const std::string &session_id,
                                const std::string &target,
                                const std::vector<std::string> &processed_hint) {
  auto session = getSession(session_id);
  if (!session) {
    DEEPSEARCH_LOG_WARNING("Resume requested for unknown session " +
                           session_id);
    return nullptr;
  }

  if (!target.empty() && target != session->target()) {
    DEEPSEARCH_LOG_WARNING("Resume of session " + session_id +
                           " names target \"" + target + "\", session has \"" +
                           session->target() + "\"");
  }

  session->touch();
  session->setResumeHint(processed_hint);

  DEEPSEARCH_LOG_INFO("Resuming session " + session_id + " with " +
                      std::to_string(processed_hint.size()) +
                      " processed items");
  return session;
}

bool SessionRegistry::cancel(const std::string &session_id) {
  auto session = getSession(session_id);
  if (!session) {
    return false;
  }
  return session->advanceStatus(types::SessionStatus::Cancelled);
}

std::size_t SessionRegistry::expire(SearchSession::Clock::time_point now) {
  std::vector<std::shared_ptr<SearchSession>> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (now - it->second->lastActivityAt() > config_.session_expiry) {
        expired.push_back(it->second);
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto &session : expired) {
    session->advanceStatus(types::SessionStatus::Cancelled);
    DEEPSEARCH_LOG_INFO("Expired session " + session->id());
  }

  return expired.size();
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> SessionRegistry::sessionIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(sessions_.size());
  for (const auto &entry : sessions_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::string SessionRegistry::generateSessionId() {
  // timestamp-counter-random, all hex
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<std::uint32_t> dist(0, 0xffff);

  std::uint64_t counter = session_counter_++;
  std::uint64_t timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();

  std::stringstream ss;
  ss << std::hex << timestamp << "-" << counter << "-" << dist(rng);
  return ss.str();
}

} // namespace server
} // namespace deepsearch
