#include "deepsearch/client/stream_state_machine.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace deepsearch;
using namespace deepsearch::client;
using namespace deepsearch::types;

namespace {

WorkResult resultFor(const std::string &item) {
  WorkResult result;
  result.item_id = item;
  result.relationship_type = RelationshipType::Direct;
  result.summary = "summary of " + item;
  return result;
}

template <typename T> std::vector<T> effectsOf(const std::vector<Effect> &all) {
  std::vector<T> matching;
  for (const auto &e : all) {
    if (std::holds_alternative<T>(e)) {
      matching.push_back(std::get<T>(e));
    }
  }
  return matching;
}

template <typename T> bool hasEffect(const std::vector<Effect> &all) {
  return !effectsOf<T>(all).empty();
}

} // namespace

// Test fixture driving the state machine with jitter disabled
class StreamStateMachineTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.jitter = 0.0;
    config_.max_reconnect_attempts = 3;
    config_.reconnect_delay = std::chrono::milliseconds(1000);
    config_.max_reconnect_backoff = std::chrono::milliseconds(30000);
    config_.poll_interval = std::chrono::milliseconds(500);
    config_.poll_retry_delay = std::chrono::milliseconds(200);
    config_.max_poll_failures = 2;
  }

  void TearDown() override {
    // Teardown code if needed
  }

  std::vector<Effect> apply(const Input &in) {
    StreamStateMachine machine(config_);
    return machine.transition(state_, in);
  }

  std::vector<Effect> event(const StreamEvent &e) {
    return apply(input::EventReceived{state_.progress.generation, e});
  }

  // Start a fresh search and get the stream accepted
  void connectFresh(const std::string &session_id = "s-1") {
    apply(input::Start{"Acme", std::nullopt, {}});
    apply(input::Registered{session_id});
    apply(input::StreamOpened{state_.progress.generation});
  }

  // Fail the stream until the machine falls back to polling
  std::vector<Effect> exhaustReconnects() {
    std::vector<Effect> last;
    for (int i = 0; i < config_.max_reconnect_attempts; ++i) {
      if (state_.phase == Phase::Disconnected) {
        apply(input::BackoffElapsed{});
        apply(input::Registered{state_.progress.session_id});
      }
      last = apply(input::TransportError{state_.progress.generation, "reset"});
    }
    return last;
  }

  StreamStateMachine::Config config_;
  MachineState state_;
};

// Test that starting registers a new session
TEST_F(StreamStateMachineTest, StartRegistersSession) {
  auto effects = apply(input::Start{"Acme", std::nullopt, {}});

  EXPECT_EQ(state_.phase, Phase::Connecting);
  ASSERT_EQ(effects.size(), 1);
  auto registration = std::get<effect::RegisterSession>(effects[0]);
  EXPECT_EQ(registration.target, "Acme");
  EXPECT_FALSE(registration.session_id.has_value());
  EXPECT_TRUE(registration.processed.empty());
}

// Test that registration opens a stream with fresh timers
TEST_F(StreamStateMachineTest, RegisteredOpensStream) {
  apply(input::Start{"Acme", std::nullopt, {}});

  auto effects = apply(input::Registered{"s-1"});

  ASSERT_EQ(effects.size(), 3);
  auto open = std::get<effect::OpenStream>(effects[0]);
  EXPECT_EQ(open.session_id, "s-1");
  EXPECT_EQ(open.target, "Acme");
  EXPECT_FALSE(open.resume_count.has_value());
  EXPECT_EQ(open.generation, state_.progress.generation);
  EXPECT_TRUE(std::holds_alternative<effect::ArmInactivityTimer>(effects[1]));
  EXPECT_TRUE(
      std::holds_alternative<effect::ArmConnectionAgeTimer>(effects[2]));

  apply(input::StreamOpened{open.generation});
  EXPECT_EQ(state_.phase, Phase::Connected);
  EXPECT_EQ(state_.progress.session_id, "s-1");
}

// Test that starting with a known session sends the processed hint
TEST_F(StreamStateMachineTest, StartWithSessionAndHint) {
  auto effects = apply(input::Start{"Acme", std::string("s-9"), {"a", "b"}});

  auto registration = std::get<effect::RegisterSession>(effects.at(0));
  ASSERT_TRUE(registration.session_id.has_value());
  EXPECT_EQ(*registration.session_id, "s-9");
  EXPECT_EQ(std::set<std::string>(registration.processed.begin(),
                                  registration.processed.end()),
            (std::set<std::string>{"a", "b"}));

  auto open = effectsOf<effect::OpenStream>(apply(input::Registered{"s-9"}));
  ASSERT_EQ(open.size(), 1);
  EXPECT_EQ(open[0].resume_count, std::optional<std::size_t>(2));
}

// Test that start is ignored while a search is running
TEST_F(StreamStateMachineTest, StartIgnoredWhileRunning) {
  connectFresh();

  auto effects = apply(input::Start{"Other", std::nullopt, {}});

  EXPECT_TRUE(effects.empty());
  EXPECT_EQ(state_.progress.target, "Acme");
}

// Test a stream from Init to Complete
TEST_F(StreamStateMachineTest, StreamToCompletion) {
  connectFresh();

  auto init = event(InitEvent{.total = 2, .progress = 0, .session_id = "s-1"});
  auto progress = effectsOf<effect::ReportProgress>(init);
  ASSERT_EQ(progress.size(), 1);
  EXPECT_EQ(progress[0].total, 2);
  EXPECT_TRUE(hasEffect<effect::ArmInactivityTimer>(init));

  auto first = event(ResultEvent{resultFor("a")});
  ASSERT_EQ(effectsOf<effect::DeliverResult>(first).size(), 1);
  EXPECT_EQ(effectsOf<effect::ReportProgress>(first)[0].processed, 1);

  event(ResultEvent{resultFor("b")});
  auto complete = event(CompleteEvent{});

  EXPECT_EQ(state_.phase, Phase::Closed);
  EXPECT_TRUE(hasEffect<effect::CloseStream>(complete));
  auto done = effectsOf<effect::ReportComplete>(complete);
  ASSERT_EQ(done.size(), 1);
  EXPECT_EQ(done[0].results.size(), 2);
}

// Test that duplicate results are discarded
TEST_F(StreamStateMachineTest, DuplicateResultsDiscarded) {
  connectFresh();
  event(ResultEvent{resultFor("a")});

  auto effects = event(ResultEvent{resultFor("a")});

  EXPECT_FALSE(hasEffect<effect::DeliverResult>(effects));
  EXPECT_FALSE(hasEffect<effect::ReportProgress>(effects));
  EXPECT_TRUE(hasEffect<effect::ArmInactivityTimer>(effects));
  EXPECT_EQ(state_.progress.results.size(), 1);
}

// Test resuming after a dropped connection: 3 of 5 delivered, then the rest
TEST_F(StreamStateMachineTest, ResumeAfterDroppedConnection) {
  connectFresh();
  event(InitEvent{.total = 5, .progress = 0, .session_id = "s-1"});
  for (const char *item : {"a", "b", "c"}) {
    event(ResultEvent{resultFor(item)});
  }

  const auto dropped_generation = state_.progress.generation;
  auto failure =
      apply(input::TransportError{dropped_generation, "connection reset"});

  EXPECT_EQ(state_.phase, Phase::Disconnected);
  EXPECT_TRUE(hasEffect<effect::CloseStream>(failure));
  EXPECT_TRUE(hasEffect<effect::CancelTimers>(failure));
  auto reconnect = effectsOf<effect::ScheduleReconnect>(failure);
  ASSERT_EQ(reconnect.size(), 1);
  EXPECT_EQ(reconnect[0].delay, std::chrono::milliseconds(1000));
  EXPECT_EQ(state_.progress.reconnect_attempts, 1);

  auto retry = apply(input::BackoffElapsed{});
  auto registration = std::get<effect::RegisterSession>(retry.at(0));
  EXPECT_EQ(registration.session_id, std::optional<std::string>("s-1"));
  EXPECT_EQ(registration.processed,
            (std::vector<std::string>{"a", "b", "c"}));

  auto open = effectsOf<effect::OpenStream>(apply(input::Registered{"s-1"}));
  ASSERT_EQ(open.size(), 1);
  EXPECT_EQ(open[0].resume_count, std::optional<std::size_t>(3));
  EXPECT_GT(open[0].generation, dropped_generation);

  // Events of the old connection are ignored
  EXPECT_TRUE(apply(input::EventReceived{dropped_generation,
                                         ResultEvent{resultFor("z")}})
                  .empty());
  EXPECT_TRUE(
      apply(input::TransportError{dropped_generation, "late"}).empty());

  event(InitEvent{.total = 5, .progress = 3, .session_id = "s-1"});
  auto replayed = event(ResultEvent{resultFor("c")});
  EXPECT_FALSE(hasEffect<effect::DeliverResult>(replayed));
  event(ResultEvent{resultFor("d")});
  EXPECT_EQ(state_.progress.reconnect_attempts, 0);
  event(ResultEvent{resultFor("e")});
  auto complete = effectsOf<effect::ReportComplete>(event(CompleteEvent{}));

  ASSERT_EQ(complete.size(), 1);
  std::set<std::string> ids;
  for (const auto &result : complete[0].results) {
    EXPECT_TRUE(ids.insert(result.item_id).second);
  }
  EXPECT_EQ(ids, (std::set<std::string>{"a", "b", "c", "d", "e"}));
}

// Test exponential backoff between failed attempts
TEST_F(StreamStateMachineTest, ReconnectBackoffGrows) {
  config_.max_reconnect_attempts = 10;
  connectFresh();

  std::vector<std::chrono::milliseconds> delays;
  for (int i = 0; i < 3; ++i) {
    auto effects =
        apply(input::InactivityTimeout{state_.progress.generation});
    delays.push_back(effectsOf<effect::ScheduleReconnect>(effects).at(0).delay);
    apply(input::BackoffElapsed{});
    apply(input::Registered{"s-1"});
  }

  EXPECT_EQ(delays[0], std::chrono::milliseconds(1000));
  EXPECT_EQ(delays[1], std::chrono::milliseconds(2000));
  EXPECT_EQ(delays[2], std::chrono::milliseconds(4000));
}

// Test the backoff calculation
TEST_F(StreamStateMachineTest, BackoffBounds) {
  StreamStateMachine exact(config_);
  EXPECT_EQ(exact.backoff(1, std::chrono::milliseconds(1000)),
            std::chrono::milliseconds(1000));
  EXPECT_EQ(exact.backoff(10, std::chrono::milliseconds(1000)),
            std::chrono::milliseconds(30000));
  EXPECT_EQ(exact.backoff(3, std::chrono::milliseconds(40000)),
            std::chrono::milliseconds(40000));

  config_.jitter = 0.2;
  StreamStateMachine jittered(config_);
  for (int i = 0; i < 50; ++i) {
    auto delay = jittered.backoff(3, std::chrono::milliseconds(1000));
    EXPECT_GE(delay, std::chrono::milliseconds(3200));
    EXPECT_LE(delay, std::chrono::milliseconds(4800));
  }
}

// Test that a reconnect warning reconnects without counting a failure
TEST_F(StreamStateMachineTest, ReconnectWarningIsPlanned) {
  connectFresh();
  event(ResultEvent{resultFor("a")});

  auto effects = event(ReconnectWarningEvent{.session_id = "s-1",
                                             .target = "Acme",
                                             .resume_hint = 2,
                                             .completed_ids = {"a", "b"}});

  EXPECT_EQ(state_.phase, Phase::Connecting);
  EXPECT_EQ(state_.progress.reconnect_attempts, 0);
  EXPECT_EQ(state_.progress.server_progress, 2);
  EXPECT_FALSE(hasEffect<effect::ScheduleReconnect>(effects));
  auto registration = effectsOf<effect::RegisterSession>(effects);
  ASSERT_EQ(registration.size(), 1);
  EXPECT_EQ(registration[0].processed, (std::vector<std::string>{"a"}));
}

// Test the client-side connection age limit
TEST_F(StreamStateMachineTest, ConnectionAgeExpired) {
  connectFresh();

  auto effects =
      apply(input::ConnectionAgeExpired{state_.progress.generation});

  EXPECT_TRUE(hasEffect<effect::CloseStream>(effects));
  EXPECT_TRUE(hasEffect<effect::RegisterSession>(effects));
  EXPECT_EQ(state_.progress.reconnect_attempts, 0);
}

// Test the switch to polling once reconnects are exhausted
TEST_F(StreamStateMachineTest, FallbackAfterReconnectsExhausted) {
  connectFresh();
  event(InitEvent{.total = 3, .progress = 0, .session_id = "s-1"});

  auto effects = exhaustReconnects();

  EXPECT_EQ(state_.phase, Phase::FallbackMode);
  auto poll = effectsOf<effect::IssuePoll>(effects);
  ASSERT_EQ(poll.size(), 1);
  EXPECT_EQ(poll[0].session_id, "s-1");
  EXPECT_TRUE(poll[0].processed.empty());
}

// Test polling to completion
TEST_F(StreamStateMachineTest, PollingConverges) {
  connectFresh();
  event(ResultEvent{resultFor("a")});
  exhaustReconnects();
  ASSERT_EQ(state_.phase, Phase::FallbackMode);

  auto first = apply(input::PollSucceeded{PollResponse{
      .results = {resultFor("a"), resultFor("b")},
      .processed = 2,
      .total = 3,
      .session_id = "s-1"}});

  auto delivered = effectsOf<effect::DeliverResult>(first);
  ASSERT_EQ(delivered.size(), 1);
  EXPECT_EQ(delivered[0].result.item_id, "b");
  auto scheduled = effectsOf<effect::SchedulePoll>(first);
  ASSERT_EQ(scheduled.size(), 1);
  EXPECT_EQ(scheduled[0].delay, std::chrono::milliseconds(500));

  auto due = effectsOf<effect::IssuePoll>(apply(input::PollDue{}));
  ASSERT_EQ(due.size(), 1);
  EXPECT_EQ(due[0].processed, (std::vector<std::string>{"a", "b"}));

  auto last = apply(input::PollSucceeded{PollResponse{
      .results = {resultFor("c")},
      .processed = 3,
      .total = 3,
      .session_id = "s-1"}});

  EXPECT_EQ(state_.phase, Phase::Closed);
  auto complete = effectsOf<effect::ReportComplete>(last);
  ASSERT_EQ(complete.size(), 1);
  EXPECT_EQ(complete[0].results.size(), 3);
}

// Test that polling adopts the session a poll created
TEST_F(StreamStateMachineTest, PollingAdoptsSessionId) {
  apply(input::Start{"Acme", std::nullopt, {}});
  for (int i = 0; i < config_.max_reconnect_attempts; ++i) {
    if (state_.phase == Phase::Disconnected) {
      apply(input::BackoffElapsed{});
    }
    apply(input::RegistrationFailed{false, "connection refused"});
  }
  ASSERT_EQ(state_.phase, Phase::FallbackMode);
  EXPECT_TRUE(state_.progress.session_id.empty());

  apply(input::PollSucceeded{PollResponse{
      .results = {}, .processed = 0, .total = 4, .session_id = "s-poll"}});

  EXPECT_EQ(state_.progress.session_id, "s-poll");
  EXPECT_EQ(state_.phase, Phase::FallbackMode);
}

// Test that repeated poll failures surface a recoverable error
TEST_F(StreamStateMachineTest, PollFailuresExhausted) {
  connectFresh();
  exhaustReconnects();

  auto first = apply(input::PollFailed{false, "timeout"});
  auto retry = effectsOf<effect::SchedulePoll>(first);
  ASSERT_EQ(retry.size(), 1);
  EXPECT_EQ(retry[0].delay, std::chrono::milliseconds(200));

  auto second = apply(input::PollFailed{false, "timeout"});

  EXPECT_EQ(state_.phase, Phase::Closed);
  auto errors = effectsOf<effect::ReportError>(second);
  ASSERT_EQ(errors.size(), 1);
  EXPECT_EQ(errors[0].kind, FailureKind::FallbackExhausted);
  EXPECT_TRUE(errors[0].recoverable);
}

// Test that a lost session is fatal and never retried
TEST_F(StreamStateMachineTest, SessionNotFoundIsFatal) {
  connectFresh();

  auto effects = event(ErrorEvent{
      .message = "Session not found: s-1",
      .fatal = true,
      .code = static_cast<int>(ErrorCode::SessionNotFound)});

  EXPECT_EQ(state_.phase, Phase::Closed);
  EXPECT_FALSE(hasEffect<effect::ScheduleReconnect>(effects));
  EXPECT_FALSE(hasEffect<effect::RegisterSession>(effects));
  auto errors = effectsOf<effect::ReportError>(effects);
  ASSERT_EQ(errors.size(), 1);
  EXPECT_EQ(errors[0].kind, FailureKind::SessionNotFound);
  EXPECT_FALSE(errors[0].recoverable);

  EXPECT_TRUE(apply(input::BackoffElapsed{}).empty());
}

// Test registration of an expired session
TEST_F(StreamStateMachineTest, RegistrationNotFoundIsFatal) {
  apply(input::Start{"Acme", std::string("old"), {"a"}});

  auto effects = apply(input::RegistrationFailed{true, "404"});

  EXPECT_EQ(state_.phase, Phase::Closed);
  auto errors = effectsOf<effect::ReportError>(effects);
  ASSERT_EQ(errors.size(), 1);
  EXPECT_EQ(errors[0].kind, FailureKind::SessionNotFound);
}

// Test a lost session during polling
TEST_F(StreamStateMachineTest, PollNotFoundIsFatal) {
  connectFresh();
  exhaustReconnects();

  auto effects = apply(input::PollFailed{true, "Session not found"});

  EXPECT_EQ(state_.phase, Phase::Closed);
  EXPECT_EQ(effectsOf<effect::ReportError>(effects).at(0).kind,
            FailureKind::SessionNotFound);
}

// Test other fatal server errors
TEST_F(StreamStateMachineTest, FatalServerErrors) {
  connectFresh();
  auto cancelled = event(
      ErrorEvent{.message = "Session was cancelled",
                 .fatal = true,
                 .code = static_cast<int>(ErrorCode::Cancelled)});
  EXPECT_EQ(effectsOf<effect::ReportError>(cancelled).at(0).kind,
            FailureKind::Cancelled);

  apply(input::Start{"Acme", std::nullopt, {}});
  apply(input::Registered{"s-2"});
  auto failed = event(ErrorEvent{.message = "Session failed", .fatal = true});
  EXPECT_EQ(effectsOf<effect::ReportError>(failed).at(0).kind,
            FailureKind::ServerError);
}

// Test non-fatal errors and heartbeats keep the connection
TEST_F(StreamStateMachineTest, WarningsAndHeartbeats) {
  connectFresh();
  event(ResultEvent{resultFor("a")});

  auto warning = event(ErrorEvent{.message = "slow lookup", .fatal = false});
  ASSERT_EQ(warning.size(), 1);
  EXPECT_TRUE(std::holds_alternative<effect::ArmInactivityTimer>(warning[0]));

  auto heartbeat = event(HeartbeatEvent{
      .progress = 3, .total = 6, .completed_ids = {"a", "b", "c"}});
  auto progress = effectsOf<effect::ReportProgress>(heartbeat);
  ASSERT_EQ(progress.size(), 1);
  EXPECT_EQ(progress[0].processed, 3);
  EXPECT_EQ(progress[0].total, 6);
  EXPECT_EQ(state_.phase, Phase::Connected);
}

// Test cancellation
TEST_F(StreamStateMachineTest, Cancel) {
  connectFresh();
  event(ResultEvent{resultFor("a")});
  const auto generation = state_.progress.generation;

  auto effects = apply(input::Cancel{});

  EXPECT_EQ(state_.phase, Phase::Closed);
  EXPECT_TRUE(hasEffect<effect::CloseStream>(effects));
  EXPECT_TRUE(hasEffect<effect::CancelTimers>(effects));
  EXPECT_FALSE(hasEffect<effect::ReportError>(effects));
  EXPECT_TRUE(state_.progress.results.empty());
  EXPECT_GT(state_.progress.generation, generation);

  EXPECT_TRUE(apply(input::EventReceived{generation, CompleteEvent{}}).empty());
  EXPECT_TRUE(apply(input::Cancel{}).empty());

  auto restart = apply(input::Start{"Acme", std::nullopt, {}});
  EXPECT_TRUE(hasEffect<effect::RegisterSession>(restart));
}

// Test phase and failure names
TEST_F(StreamStateMachineTest, Names) {
  EXPECT_EQ(phaseToString(Phase::FallbackMode), "fallback");
  EXPECT_EQ(phaseToString(Phase::Connected), "connected");
  EXPECT_EQ(failureKindToString(FailureKind::SessionNotFound),
            "session_not_found");
}
