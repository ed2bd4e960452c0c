#include "deepsearch/client/stream_manager.hpp"
#include "deepsearch/utils/error.hpp"
#include "deepsearch/utils/logging.hpp"

namespace deepsearch {
namespace client {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

StreamManager::StreamManager(std::shared_ptr<SearchApi> api,
                             StreamConnectionFactory connection_factory,
                             const Config &config)
    : api_(std::move(api)), connection_factory_(std::move(connection_factory)),
      config_(config), machine_(config.machine) {
  loop_thread_ = std::thread(&StreamManager::eventLoop, this);
  io_thread_ = std::thread(&StreamManager::ioLoop, this);
}

StreamManager::~StreamManager() {
  cancelled_ = true;

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stopping_ = true;
  }
  queue_cv_.notify_all();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }

  closeStream();

  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    io_stopping_ = true;
  }
  io_cv_.notify_all();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

void StreamManager::setResultCallback(ResultCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  result_callback_ = std::move(callback);
}

void StreamManager::setProgressCallback(ProgressCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  progress_callback_ = std::move(callback);
}

void StreamManager::setCompleteCallback(CompleteCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  complete_callback_ = std::move(callback);
}

void StreamManager::setErrorCallback(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_callback_ = std::move(callback);
}

void StreamManager::setPhaseCallback(PhaseCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  phase_callback_ = std::move(callback);
}

void StreamManager::start(const std::string &target,
                          const std::optional<std::string> &session_id,
                          const std::vector<std::string> &processed_hint) {
  DEEPSEARCH_LOG_INFO("Starting search for " + target +
                      (session_id ? " resuming session " + *session_id : ""));
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    closed_ = false;
  }
  cancelled_ = false;
  post(input::Start{target, session_id, processed_hint});
}

void StreamManager::cancel() {
  DEEPSEARCH_LOG_INFO("Cancelling search");
  cancelled_ = true;
  if (std::this_thread::get_id() != loop_thread_.get_id()) {
    // Wait out a callback that is already running
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
  }
  post(input::Cancel{});
}

Phase StreamManager::phase() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.phase;
}

bool StreamManager::waitUntilClosed(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return closed_cv_.wait_for(lock, timeout, [this]() { return closed_; });
}

std::vector<types::WorkResult> StreamManager::results() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.progress.results;
}

std::string StreamManager::sessionId() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_.progress.session_id;
}

void StreamManager::post(Input in) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    inputs_.push_back(std::move(in));
  }
  queue_cv_.notify_one();
}

void StreamManager::postIo(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(io_mutex_);
    io_jobs_.push_back(std::move(job));
  }
  io_cv_.notify_one();
}

void StreamManager::eventLoop() {
  DEEPSEARCH_LOG_DEBUG("Stream manager loop started");

  while (true) {
    Input in;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      while (true) {
        if (stopping_) {
          DEEPSEARCH_LOG_DEBUG("Stream manager loop stopped");
          return;
        }
        if (!inputs_.empty()) {
          break;
        }

        // Turn due timers into inputs
        const auto now = std::chrono::steady_clock::now();
        std::optional<std::chrono::steady_clock::time_point> next_due;
        for (auto &timer : timers_) {
          if (!timer) {
            continue;
          }
          if (timer->due <= now) {
            inputs_.push_back(std::move(timer->input));
            timer.reset();
          } else if (!next_due || timer->due < *next_due) {
            next_due = timer->due;
          }
        }
        if (!inputs_.empty()) {
          break;
        }

        if (next_due) {
          queue_cv_.wait_until(lock, *next_due);
        } else {
          queue_cv_.wait(lock);
        }
      }

      in = std::move(inputs_.front());
      inputs_.pop_front();
    }

    try {
      handle(in);
    } catch (const std::exception &e) {
      DEEPSEARCH_LOG_ERROR(std::string("Error handling stream input: ") +
                           e.what());
    }
  }
}

void StreamManager::ioLoop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(io_mutex_);
      io_cv_.wait(lock, [this]() { return io_stopping_ || !io_jobs_.empty(); });
      if (io_stopping_) {
        return;
      }
      job = std::move(io_jobs_.front());
      io_jobs_.pop_front();
    }
    job();
  }
}

template <typename Callback, typename... Args>
void StreamManager::deliver(Callback StreamManager::*member, Args &&...args) {
  Callback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = this->*member;
  }
  if (!callback) {
    return;
  }

  std::lock_guard<std::mutex> delivery(delivery_mutex_);
  if (cancelled_) {
    return;
  }
  callback(std::forward<Args>(args)...);
}

void StreamManager::handle(const Input &in) {
  std::vector<Effect> effects;
  Phase before;
  Phase after;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    before = state_.phase;
    effects = machine_.transition(state_, in);
    after = state_.phase;
  }

  for (const auto &action : effects) {
    execute(action);
  }

  if (after != before) {
    DEEPSEARCH_LOG_DEBUG("Stream phase " + phaseToString(before) + " -> " +
                         phaseToString(after));
    deliver(&StreamManager::phase_callback_, after);
  }

  if (after == Phase::Closed && before != Phase::Closed) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      closed_ = true;
    }
    closed_cv_.notify_all();
  }
}

void StreamManager::execute(const Effect &action) {
  std::visit(
      overloaded{
          [&](const effect::RegisterSession &registration) {
            types::SessionRequest request;
            request.target = registration.target;
            request.session_id = registration.session_id;
            request.processed_item_ids = registration.processed;

            postIo([this, request]() {
              try {
                post(input::Registered{api_->registerSession(request)});
              } catch (const SessionNotFoundException &e) {
                post(input::RegistrationFailed{true, e.what()});
              } catch (const std::exception &e) {
                post(input::RegistrationFailed{false, e.what()});
              }
            });
          },

          [&](const effect::OpenStream &open) { openStream(open); },

          [&](const effect::CloseStream &) { closeStream(); },

          [&](const effect::ArmInactivityTimer &arm) {
            setTimer(kInactivity, config_.inactivity_timeout,
                     input::InactivityTimeout{arm.generation});
          },

          [&](const effect::ArmConnectionAgeTimer &arm) {
            setTimer(kConnectionAge, config_.max_connection_age,
                     input::ConnectionAgeExpired{arm.generation});
          },

          [&](const effect::CancelTimers &) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            for (auto &timer : timers_) {
              timer.reset();
            }
          },

          [&](const effect::ScheduleReconnect &schedule) {
            setTimer(kReconnect, schedule.delay, input::BackoffElapsed{});
          },

          [&](const effect::IssuePoll &poll) {
            postIo([this, poll]() {
              try {
                post(input::PollSucceeded{
                    api_->poll(poll.target, poll.session_id, poll.processed)});
              } catch (const SessionNotFoundException &e) {
                post(input::PollFailed{true, e.what()});
              } catch (const std::exception &e) {
                post(input::PollFailed{false, e.what()});
              }
            });
          },

          [&](const effect::SchedulePoll &schedule) {
            setTimer(kPoll, schedule.delay, input::PollDue{});
          },

          [&](const effect::DeliverResult &deliver_result) {
            deliver(&StreamManager::result_callback_, deliver_result.result);
          },

          [&](const effect::ReportProgress &report) {
            deliver(&StreamManager::progress_callback_, report.processed,
                    report.total);
          },

          [&](const effect::ReportComplete &report) {
            deliver(&StreamManager::complete_callback_, report.results);
          },

          [&](const effect::ReportError &report) {
            deliver(&StreamManager::error_callback_, report.kind,
                    report.message, report.recoverable);
          },
      },
      action);
}

void StreamManager::openStream(const effect::OpenStream &open) {
  closeStream();

  const auto generation = open.generation;
  connection_ = connection_factory_();
  if (!connection_) {
    post(input::TransportError{generation, "No stream connection available"});
    return;
  }

  connection_->setEventCallback([this, generation](types::StreamEvent event) {
    post(input::EventReceived{generation, std::move(event)});
  });
  connection_->setErrorCallback([this, generation](std::error_code error) {
    post(input::TransportError{generation, error.message()});
  });
  connection_->setCloseCallback(
      [this, generation]() { post(input::StreamClosed{generation}); });
  connection_->setOpenCallback(
      [this, generation]() { post(input::StreamOpened{generation}); });

  StreamRequest request;
  request.target = open.target;
  request.session_id = open.session_id;
  request.resume_count = open.resume_count;

  try {
    connection_->connect(request);
  } catch (const std::exception &e) {
    post(input::TransportError{generation, e.what()});
  }
}

void StreamManager::closeStream() {
  if (connection_) {
    connection_->disconnect();
    connection_.reset();
  }
}

void StreamManager::setTimer(TimerKind kind, std::chrono::milliseconds delay,
                             Input in) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    timers_[kind] =
        Timer{std::chrono::steady_clock::now() + delay, std::move(in)};
  }
  queue_cv_.notify_one();
}

} // namespace client
} // namespace deepsearch
