#include "deepsearch/client/http_sse_connection.hpp"
#include "deepsearch/utils/error.hpp"
#include "deepsearch/utils/json_utils.hpp"
#include "deepsearch/utils/logging.hpp"

#include <curl/curl.h>

namespace deepsearch {
namespace client {

namespace {

std::string escape(CURL *curl, const std::string &value) {
  char *escaped =
      curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  if (!escaped) {
    throw TransportException("Failed to encode query parameter");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

// Aborts the transfer once the stop flag is raised
int xferInfoCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  return static_cast<std::atomic<bool> *>(clientp)->load() ? 1 : 0;
}

} // namespace

HttpSseConnection::HttpSseConnection(const Config &config) : config_(config) {
  static std::once_flag curl_init_flag;
  std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpSseConnection::~HttpSseConnection() { disconnect(); }

void HttpSseConnection::setEventCallback(
    std::function<void(types::StreamEvent)> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

void HttpSseConnection::setErrorCallback(
    std::function<void(std::error_code)> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_callback_ = std::move(callback);
}

void HttpSseConnection::setCloseCallback(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  close_callback_ = std::move(callback);
}

void HttpSseConnection::setOpenCallback(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  open_callback_ = std::move(callback);
}

std::string HttpSseConnection::buildUrl(const std::string &base_url,
                                        const StreamRequest &request) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw TransportException(
        std::make_error_code(std::errc::resource_unavailable_try_again));
  }

  std::string url = base_url + "/search/stream?target=" +
                    escape(curl, request.target) +
                    "&sessionId=" + escape(curl, request.session_id);
  if (request.resume_count) {
    url += "&resumeCount=" + std::to_string(*request.resume_count);
  }

  curl_easy_cleanup(curl);
  return url;
}

void HttpSseConnection::connect(const StreamRequest &request) {
  if (thread_.joinable()) {
    throw TransportException("Stream connection already used");
  }

  std::string url = buildUrl(config_.base_url, request);

  curl_ = curl_easy_init();
  if (!curl_) {
    throw TransportException(
        std::make_error_code(std::errc::resource_unavailable_try_again));
  }

  stopping_ = false;
  opened_ = false;
  http_status_ = 0;
  error_body_.clear();
  parser_.reset();

  thread_ = std::thread(&HttpSseConnection::receiveThread, this, url);
}

void HttpSseConnection::disconnect() {
  stopping_ = true;

  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      // Called from one of our own callbacks; the thread ends on its own
      return;
    }
    thread_.join();
  }

  if (curl_) {
    curl_easy_cleanup(curl_);
    curl_ = nullptr;
  }
  connected_ = false;
}

bool HttpSseConnection::isConnected() const { return connected_; }

size_t HttpSseConnection::writeCallback(char *ptr, size_t size, size_t nmemb,
                                        void *userdata) {
  auto *connection = static_cast<HttpSseConnection *>(userdata);
  if (connection->stopping_) {
    return 0;
  }
  connection->handleData(std::string(ptr, size * nmemb));
  return size * nmemb;
}

void HttpSseConnection::handleData(const std::string &chunk) {
  if (!opened_) {
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_status_);
    if (http_status_ != 200) {
      error_body_ += chunk;
      return;
    }

    opened_ = true;
    connected_ = true;

    std::function<void()> open_callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      open_callback = open_callback_;
    }
    if (open_callback) {
      open_callback();
    }
  }

  for (const auto &payload : parser_.feed(chunk)) {
    if (stopping_) {
      return;
    }

    types::StreamEvent event;
    try {
      event = json_utils::parseEvent(payload);
    } catch (const DeepSearchException &e) {
      DEEPSEARCH_LOG_ERROR(std::string("Failed to parse event data: ") +
                           e.what());
      continue;
    }

    std::function<void(types::StreamEvent)> event_callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      event_callback = event_callback_;
    }
    if (event_callback) {
      event_callback(std::move(event));
    }
  }
}

void HttpSseConnection::reportError(std::error_code error) {
  std::function<void(std::error_code)> error_callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_callback = error_callback_;
  }
  if (error_callback) {
    error_callback(error);
  }
}

void HttpSseConnection::receiveThread(std::string url) {
  DEEPSEARCH_LOG_DEBUG("SSE connection opening: " + url);

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Accept: text/event-stream");
  headers = curl_slist_append(headers, "Cache-Control: no-cache");

  curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,
                   HttpSseConnection::writeCallback);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, this);
  curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, xferInfoCallback);
  curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &stopping_);
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(config_.connect_timeout.count()));
  curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, 0L); // No timeout for SSE
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl_);
  curl_slist_free_all(headers);

  connected_ = false;

  if (stopping_) {
    DEEPSEARCH_LOG_DEBUG("SSE connection closed locally");
    return;
  }

  if (!opened_) {
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_status_);
  }

  if (http_status_ != 0 && http_status_ != 200) {
    DEEPSEARCH_LOG_WARNING("SSE connection rejected with HTTP " +
                           std::to_string(http_status_) + ": " + error_body_);
    reportError(make_error_code(StreamError::HttpStatus));
    return;
  }

  if (res == CURLE_OK) {
    DEEPSEARCH_LOG_DEBUG("SSE stream ended by server");
    std::function<void()> close_callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      close_callback = close_callback_;
    }
    if (close_callback) {
      close_callback();
    }
    return;
  }

  DEEPSEARCH_LOG_WARNING(std::string("SSE connection failed: ") +
                         curl_easy_strerror(res));
  if (res == CURLE_OPERATION_TIMEDOUT) {
    reportError(make_error_code(StreamError::Timeout));
  } else if (opened_) {
    reportError(make_error_code(StreamError::Disconnected));
  } else {
    reportError(make_error_code(StreamError::ConnectFailed));
  }
}

} // namespace client
} // namespace deepsearch
