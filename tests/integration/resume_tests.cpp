#include "deepsearch/client/stream_manager.hpp"
#include "deepsearch/server/batch_dispatcher.hpp"
#include "deepsearch/server/fallback_poller.hpp"
#include "deepsearch/server/session_registry.hpp"
#include "deepsearch/server/stream_transport.hpp"
#include "deepsearch/utils/error.hpp"
#include "fake_lookup_worker.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <condition_variable>
#include <map>
#include <set>
#include <thread>

using namespace deepsearch;
using namespace deepsearch::client;
using namespace deepsearch::server;
using namespace deepsearch::types;
using deepsearch::testing::FakeLookupWorker;

namespace {

// Registers and polls directly against in-process server components
class LocalSearchApi : public SearchApi {
public:
  LocalSearchApi(SessionRegistry &registry, PollService &poll_service,
                 std::vector<std::string> items)
      : registry_(registry), poll_service_(poll_service),
        items_(std::move(items)) {}

  std::string registerSession(const SessionRequest &request) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
    }
    if (request.session_id) {
      auto session = registry_.registerResume(
          *request.session_id, request.target, request.processed_item_ids);
      if (!session) {
        throw SessionNotFoundException(*request.session_id);
      }
      return session->id();
    }
    return registry_
        .createSession(request.target, items_, request.processed_item_ids)
        ->id();
  }

  PollResponse poll(const std::string &target, const std::string &session_id,
                    const std::vector<std::string> &processed) override {
    std::optional<std::string> id;
    if (!session_id.empty()) {
      id = session_id;
    }
    return poll_service_.poll(target, id, processed);
  }

  std::vector<SessionRequest> requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

private:
  SessionRegistry &registry_;
  PollService &poll_service_;
  std::vector<std::string> items_;
  std::mutex mutex_;
  std::vector<SessionRequest> requests_;
};

// Hands stream events to the client, optionally failing after some results
class ForwardingWriter : public EventWriter {
public:
  ForwardingWriter(std::function<void(StreamEvent)> sink,
                   const std::atomic<bool> &stop,
                   std::optional<std::size_t> drop_after)
      : sink_(std::move(sink)), stop_(stop), drop_after_(drop_after) {}

  std::error_code write(const StreamEvent &event) override {
    if (stop_) {
      return std::make_error_code(std::errc::operation_canceled);
    }
    if (std::holds_alternative<ResultEvent>(event) && drop_after_) {
      if (results_ == *drop_after_) {
        return std::make_error_code(std::errc::connection_reset);
      }
      ++results_;
    }
    sink_(event);
    return {};
  }

private:
  std::function<void(StreamEvent)> sink_;
  const std::atomic<bool> &stop_;
  std::optional<std::size_t> drop_after_;
  std::size_t results_ = 0;
};

// Stream connection served by a SessionStream on its own thread
class LocalStreamConnection : public StreamConnection {
public:
  LocalStreamConnection(SessionStream &stream,
                        std::optional<std::size_t> drop_after)
      : stream_(stream), drop_after_(drop_after) {}

  ~LocalStreamConnection() override { disconnect(); }

  void setEventCallback(std::function<void(StreamEvent)> callback) override {
    on_event_ = std::move(callback);
  }
  void setErrorCallback(std::function<void(std::error_code)> callback) override {
    on_error_ = std::move(callback);
  }
  void setCloseCallback(std::function<void()> callback) override {
    on_close_ = std::move(callback);
  }
  void setOpenCallback(std::function<void()> callback) override {
    on_open_ = std::move(callback);
  }

  void connect(const StreamRequest &request) override {
    disconnect();
    stop_ = false;
    connected_ = true;
    thread_ = std::thread([this, request]() {
      if (on_open_) {
        on_open_();
      }
      ForwardingWriter writer(on_event_, stop_, drop_after_);
      auto outcome = stream_.run(writer, request.session_id,
                                 request.resume_count, &stop_);
      connected_ = false;
      if (stop_) {
        return;
      }
      if (outcome == SessionStream::Outcome::WriteFailed) {
        if (on_error_) {
          on_error_(make_error_code(StreamError::Disconnected));
        }
      } else if (on_close_) {
        on_close_();
      }
    });
  }

  void disconnect() override {
    stop_ = true;
    if (thread_.joinable()) {
      thread_.join();
    }
    connected_ = false;
  }

  bool isConnected() const override { return connected_; }

private:
  SessionStream &stream_;
  std::optional<std::size_t> drop_after_;
  std::function<void(StreamEvent)> on_event_;
  std::function<void(std::error_code)> on_error_;
  std::function<void()> on_close_;
  std::function<void()> on_open_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> connected_{false};
  std::thread thread_;
};

} // namespace

// Test fixture running a client against in-process server components
class ResumeTest : public ::testing::Test {
protected:
  void SetUp() override {
    items_ = {"a", "b", "c", "d", "e"};
    config_.machine.jitter = 0.0;
    config_.machine.reconnect_delay = std::chrono::milliseconds(10);
    config_.machine.max_reconnect_backoff = std::chrono::milliseconds(50);
    config_.machine.poll_interval = std::chrono::milliseconds(10);
    config_.machine.poll_retry_delay = std::chrono::milliseconds(10);
    stream_config_.heartbeat_interval = std::chrono::milliseconds(20);
    makeServer(false);
  }

  void TearDown() override {
    manager_.reset();
    worker_->releaseAll();
    dispatcher_->stop();
  }

  void makeServer(bool gated) {
    if (dispatcher_) {
      worker_->releaseAll();
      dispatcher_->stop();
    }
    poll_service_.reset();
    worker_ = std::make_shared<FakeLookupWorker>(gated);
    dispatcher_ = std::make_unique<BatchDispatcher>(
        worker_,
        BatchDispatcher::Config{.worker_pool_width = 1, .batch_size = 1});
    poll_service_ = std::make_unique<PollService>(
        registry_, *dispatcher_, items_,
        PollService::Config{.poll_timeout = std::chrono::seconds(2),
                            .poll_batch_size = 2});
    api_ = std::make_shared<LocalSearchApi>(registry_, *poll_service_, items_);
  }

  StreamManager &manager() {
    if (!manager_) {
      stream_ = std::make_unique<SessionStream>(registry_, dispatcher_.get(),
                                                stream_config_);
      auto factory = [this]() -> std::unique_ptr<StreamConnection> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (refuse_streams_) {
          return nullptr;
        }
        std::optional<std::size_t> drop_after;
        auto it = drop_plan_.find(connections_);
        if (it != drop_plan_.end()) {
          drop_after = it->second;
        }
        ++connections_;
        return std::make_unique<LocalStreamConnection>(*stream_, drop_after);
      };
      manager_ = std::make_unique<StreamManager>(api_, factory, config_);
      manager_->setResultCallback([this](const WorkResult &result) {
        std::lock_guard<std::mutex> lock(mutex_);
        delivered_.push_back(result.item_id);
        cv_.notify_all();
      });
      manager_->setCompleteCallback([this](const std::vector<WorkResult> &all) {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_ = all.size();
      });
      manager_->setErrorCallback(
          [this](FailureKind kind, const std::string &, bool) {
            std::lock_guard<std::mutex> lock(mutex_);
            failure_ = kind;
          });
    }
    return *manager_;
  }

  bool waitForDelivered(std::size_t n) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(5),
                        [&] { return delivered_.size() >= n; });
  }

  std::vector<std::string> items_;
  SessionRegistry registry_;
  std::shared_ptr<FakeLookupWorker> worker_;
  std::unique_ptr<BatchDispatcher> dispatcher_;
  std::unique_ptr<PollService> poll_service_;
  std::unique_ptr<SessionStream> stream_;
  std::shared_ptr<LocalSearchApi> api_;
  SessionStream::Config stream_config_;
  StreamManager::Config config_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::size_t, std::size_t> drop_plan_;
  std::size_t connections_ = 0;
  bool refuse_streams_ = false;
  std::vector<std::string> delivered_;
  std::optional<std::size_t> completed_;
  std::optional<FailureKind> failure_;

  std::unique_ptr<StreamManager> manager_;
};

// Test a dropped stream resumes with every result delivered exactly once
TEST_F(ResumeTest, DroppedStreamResumesWithoutDuplicates) {
  drop_plan_[0] = 3;

  manager().start("Acme");

  ASSERT_TRUE(manager().waitUntilClosed(std::chrono::seconds(10)));
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_FALSE(failure_.has_value());
  ASSERT_EQ(delivered_.size(), 5);
  EXPECT_EQ(std::set<std::string>(delivered_.begin(), delivered_.end()),
            std::set<std::string>(items_.begin(), items_.end()));
  EXPECT_EQ(completed_, std::optional<std::size_t>(5));
  EXPECT_GE(connections_, 2);

  auto requests = api_->requests();
  ASSERT_GE(requests.size(), 2);
  EXPECT_FALSE(requests[0].session_id.has_value());
  EXPECT_EQ(requests[1].session_id, std::optional<std::string>(manager().sessionId()));
  EXPECT_EQ(requests[1].processed_item_ids.size(), 3);
}

// Test resuming across server-requested reconnects
TEST_F(ResumeTest, SurvivesConnectionAgeLimit) {
  makeServer(true);
  stream_config_.max_connection_age = std::chrono::milliseconds(60);

  manager().start("Acme");

  std::thread feeder([this]() {
    for (int i = 0; i < 5; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(40));
      worker_->release(1);
    }
  });

  bool closed = manager().waitUntilClosed(std::chrono::seconds(10));
  feeder.join();
  ASSERT_TRUE(closed);

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_FALSE(failure_.has_value());
  EXPECT_EQ(delivered_.size(), 5);
  EXPECT_EQ(std::set<std::string>(delivered_.begin(), delivered_.end()).size(),
            5);
  EXPECT_GE(connections_, 2);
}

// Test a search that never streams converges through polling
TEST_F(ResumeTest, FallbackPollingConverges) {
  refuse_streams_ = true;
  config_.machine.max_reconnect_attempts = 2;

  manager().start("Acme");

  ASSERT_TRUE(manager().waitUntilClosed(std::chrono::seconds(10)));
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_FALSE(failure_.has_value());
  EXPECT_EQ(delivered_.size(), 5);
  EXPECT_EQ(std::set<std::string>(delivered_.begin(), delivered_.end()).size(),
            5);
  EXPECT_EQ(completed_, std::optional<std::size_t>(5));
}

// Test resuming a session the server no longer has
TEST_F(ResumeTest, UnknownSessionIsFatal) {
  manager().start("Acme", std::string("expired-session"), {"a", "b"});

  ASSERT_TRUE(manager().waitUntilClosed(std::chrono::seconds(5)));
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(failure_, std::optional<FailureKind>(FailureKind::SessionNotFound));
  EXPECT_TRUE(delivered_.empty());
  EXPECT_EQ(connections_, 0);
  EXPECT_EQ(api_->requests().size(), 1);
}

// Test a session cancelled on the server ends the client search
TEST_F(ResumeTest, ServerCancellationEndsSearch) {
  makeServer(true);
  worker_->release(2);

  manager().start("Acme");
  ASSERT_TRUE(waitForDelivered(2));

  ASSERT_TRUE(registry_.cancel(manager().sessionId()));

  ASSERT_TRUE(manager().waitUntilClosed(std::chrono::seconds(5)));
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(failure_, std::optional<FailureKind>(FailureKind::Cancelled));
  EXPECT_EQ(delivered_.size(), 2);
  EXPECT_FALSE(completed_.has_value());
}

// Test a client cancel leaves the server session running
TEST_F(ResumeTest, ClientCancelStopsDelivery) {
  makeServer(true);
  worker_->release(1);

  manager().start("Acme");
  ASSERT_TRUE(waitForDelivered(1));
  std::string session_id = manager().sessionId();

  manager().cancel();
  ASSERT_TRUE(manager().waitUntilClosed(std::chrono::seconds(5)));
  worker_->releaseAll();

  auto session = registry_.getSession(session_id);
  ASSERT_NE(session, nullptr);
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(delivered_.size(), 1);
  EXPECT_FALSE(completed_.has_value());
  EXPECT_FALSE(failure_.has_value());
}
