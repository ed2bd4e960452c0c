#ifndef DEEPSEARCH_TESTS_FAKE_LOOKUP_WORKER_HPP_
#define DEEPSEARCH_TESTS_FAKE_LOOKUP_WORKER_HPP_

#include "deepsearch/server/lookup_worker.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace deepsearch {
namespace testing {

// Lookup worker whose lookups can be held back and released one at a time.
// Items marked with failOn() throw, items marked with hangOn() never return
// until releaseAll().
class FakeLookupWorker : public server::LookupWorker {
public:
  explicit FakeLookupWorker(bool gated = false)
      : permits_(gated ? 0 : kUnlimited) {}

  ~FakeLookupWorker() override { releaseAll(); }

  types::WorkResult investigate(const std::string &target,
                                const std::string &item) override {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      ++started_;
      ++in_flight_;
      max_in_flight_ = std::max(max_in_flight_, in_flight_);
      cv_.notify_all();
      cv_.wait(lock, [&] {
        return released_ || (permits_ > 0 && hanging_.count(item) == 0);
      });
      if (!released_ && permits_ != kUnlimited) {
        --permits_;
      }
      ++finished_;
      --in_flight_;
      cv_.notify_all();
      if (failing_.count(item) != 0) {
        throw std::runtime_error("lookup failed for " + item);
      }
    }

    types::WorkResult result;
    result.item_id = item;
    result.relationship_type = types::RelationshipType::Direct;
    result.summary = "Found link between " + target + " and " + item;
    result.sources = {"https://example.org/" + item};
    return result;
  }

  // Let n more lookups finish
  void release(std::size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (permits_ != kUnlimited) {
      permits_ += n;
    }
    cv_.notify_all();
  }

  void releaseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    permits_ = kUnlimited;
    cv_.notify_all();
  }

  void failOn(const std::string &item) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.insert(item);
  }

  void hangOn(const std::string &item) {
    std::lock_guard<std::mutex> lock(mutex_);
    hanging_.insert(item);
  }

  bool waitForStarted(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return started_ >= n; });
  }

  bool waitForFinished(std::size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return finished_ >= n; });
  }

  std::size_t started() {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
  }

  // Most lookups ever running at the same time
  std::size_t maxInFlight() {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_in_flight_;
  }

private:
  static constexpr std::size_t kUnlimited =
      std::numeric_limits<std::size_t>::max();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t permits_;
  bool released_ = false;
  std::size_t started_ = 0;
  std::size_t finished_ = 0;
  std::size_t in_flight_ = 0;
  std::size_t max_in_flight_ = 0;
  std::unordered_set<std::string> failing_;
  std::unordered_set<std::string> hanging_;
};

} // namespace testing
} // namespace deepsearch

#endif // DEEPSEARCH_TESTS_FAKE_LOOKUP_WORKER_HPP_
