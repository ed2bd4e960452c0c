#include "deepsearch/client/search_api.hpp"
#include "deepsearch/utils/error.hpp"
#include "deepsearch/utils/json_utils.hpp"
#include "deepsearch/utils/logging.hpp"

#include <curl/curl.h>
#include <mutex>

namespace deepsearch {
namespace client {

namespace {

size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *response = static_cast<std::string *>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

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

// Server error bodies look like {"error": {"code", "message", "data"}}
types::ErrorData errorFromBody(const std::string &body, long status) {
  types::ErrorData error{static_cast<int>(types::ErrorCode::TransportError),
                         "HTTP " + std::to_string(status), nullptr};
  try {
    auto json = nlohmann::json::parse(body);
    if (json.is_object() && json.contains("error")) {
      error = json["error"].get<types::ErrorData>();
    }
  } catch (const nlohmann::json::exception &) {
    if (!body.empty()) {
      error.message += ": " + body;
    }
  }
  return error;
}

} // namespace

CurlSearchApi::CurlSearchApi(const Config &config) : config_(config) {
  static std::once_flag curl_init_flag;
  std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

CurlSearchApi::Reply CurlSearchApi::perform(const std::string &url,
                                            const std::string *post_body) const {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw TransportException(
        std::make_error_code(std::errc::resource_unavailable_try_again));
  }

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");
  if (post_body) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
  }

  Reply reply;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  if (post_body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(post_body->size()));
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(config_.connect_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(config_.request_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw TimeoutException("Request timed out: " + url);
  }
  if (res != CURLE_OK) {
    throw TransportException(std::string("HTTP request failed: ") +
                                 curl_easy_strerror(res),
                             {{"url", url}});
  }

  DEEPSEARCH_LOG_DEBUG("HTTP " + std::to_string(reply.status) + " from " + url +
                       ", response length: " +
                       std::to_string(reply.body.size()));
  return reply;
}

std::string
CurlSearchApi::registerSession(const types::SessionRequest &request) {
  const std::string body = nlohmann::json(request).dump();
  Reply reply = perform(config_.base_url + "/search/session", &body);

  if (reply.status == 404 && request.session_id) {
    throw SessionNotFoundException(*request.session_id);
  }
  if (reply.status < 200 || reply.status >= 300) {
    types::ErrorData error = errorFromBody(reply.body, reply.status);
    throw TransportException(static_cast<types::ErrorCode>(error.code),
                             "Session registration failed: " + error.message,
                             {{"status", reply.status}});
  }

  auto json = json_utils::parse(reply.body);
  if (!json.is_object() || !json.contains("sessionId") ||
      !json["sessionId"].is_string()) {
    throw ProtocolException("Session registration reply lacks a sessionId");
  }
  return json["sessionId"].get<std::string>();
}

types::PollResponse
CurlSearchApi::poll(const std::string &target, const std::string &session_id,
                    const std::vector<std::string> &processed) {
  std::string url;
  {
    CURL *curl = curl_easy_init();
    if (!curl) {
      throw TransportException(
          std::make_error_code(std::errc::resource_unavailable_try_again));
    }
    try {
      url = config_.base_url + "/search/poll?target=" + escape(curl, target);
      if (!session_id.empty()) {
        url += "&sessionId=" + escape(curl, session_id);
      }
      if (!processed.empty()) {
        url += "&processed=" + escape(curl, json_utils::joinIdList(processed));
      }
    } catch (...) {
      curl_easy_cleanup(curl);
      throw;
    }
    curl_easy_cleanup(curl);
  }

  Reply reply = perform(url, nullptr);

  if (reply.status == 404 && !session_id.empty()) {
    throw SessionNotFoundException(session_id);
  }
  if (reply.status < 200 || reply.status >= 300) {
    types::ErrorData error = errorFromBody(reply.body, reply.status);
    error.message = "Poll failed: " + error.message;
    throw DeepSearchException(error);
  }

  auto json = json_utils::parse(reply.body);
  try {
    return json.get<types::PollResponse>();
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolException(std::string("Malformed poll reply: ") + e.what());
  }
}

} // namespace client
} // namespace deepsearch
