#include "deepsearch/server/search_server.hpp"
#include "deepsearch/utils/error.hpp"
#include "deepsearch/utils/json_utils.hpp"
#include "deepsearch/utils/logging.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <limits>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <unordered_map>

namespace deepsearch {
namespace server {

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string urlDecode(const std::string &value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      int high = hexValue(value[i + 1]);
      int low = hexValue(value[i + 2]);
      if (high >= 0 && low >= 0) {
        decoded += static_cast<char>(high * 16 + low);
        i += 2;
        continue;
      }
    }
    decoded += value[i] == '+' ? ' ' : value[i];
  }
  return decoded;
}

std::string pathOf(const std::string &target) {
  return target.substr(0, target.find('?'));
}

std::unordered_map<std::string, std::string>
parseQuery(const std::string &target) {
  std::unordered_map<std::string, std::string> params;
  auto pos = target.find('?');
  if (pos == std::string::npos) {
    return params;
  }

  std::vector<std::string> parts;
  auto query = target.substr(pos + 1);
  boost::split(parts, query, boost::is_any_of("&"));
  for (const auto &part : parts) {
    if (part.empty()) {
      continue;
    }
    auto eq = part.find('=');
    if (eq == std::string::npos) {
      params[urlDecode(part)] = "";
    } else {
      params[urlDecode(part.substr(0, eq))] = urlDecode(part.substr(eq + 1));
    }
  }
  return params;
}

std::optional<std::string>
queryParam(const std::unordered_map<std::string, std::string> &params,
           const std::string &key) {
  auto it = params.find(key);
  if (it == params.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

void setCorsHeaders(Response &res) {
  res.set(http::field::access_control_allow_origin, "*");
  res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
  res.set(http::field::access_control_allow_headers,
          "Content-Type, Cache-Control");
}

Response jsonResponse(http::status status, const nlohmann::json &body,
                      unsigned version) {
  Response res{status, version};
  res.set(http::field::server, "deepsearch");
  res.set(http::field::content_type, "application/json; charset=utf-8");
  setCorsHeaders(res);
  res.keep_alive(false);
  res.body() = body.dump();
  res.prepare_payload();
  return res;
}

Response errorResponse(http::status status, types::ErrorCode code,
                       const std::string &message, unsigned version,
                       const nlohmann::json &data = nullptr) {
  return jsonResponse(status, errorBody(code, message, data), version);
}

std::string isoTimestamp() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

// Writes SSE frames straight to the connection socket
class SocketEventWriter : public EventWriter {
public:
  explicit SocketEventWriter(tcp::socket &socket) : socket_(socket) {}

  std::error_code write(const types::StreamEvent &event) override {
    const std::string frame = json_utils::sseFrame(event);
    beast::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(frame), ec);
    if (ec) {
      DEEPSEARCH_LOG_DEBUG("SSE write failed: " + ec.message());
      return std::error_code(ec.value(), std::system_category());
    }
    return {};
  }

private:
  tcp::socket &socket_;
};

// Keeps the active connection count accurate however the handler exits
class ConnectionGuard {
public:
  ConnectionGuard(std::mutex &mutex, std::condition_variable &cv,
                  std::size_t &count)
      : mutex_(mutex), cv_(cv), count_(count) {}

  ~ConnectionGuard() {
    std::lock_guard<std::mutex> lock(mutex_);
    --count_;
    cv_.notify_all();
  }

private:
  std::mutex &mutex_;
  std::condition_variable &cv_;
  std::size_t &count_;
};

// Reads and discards what is left of a rejected request so that closing the
// socket does not reset the connection before the client reads the response
void drainRequest(tcp::socket &socket, std::size_t limit) {
  std::array<char, 8192> chunk;
  std::size_t total = 0;
  beast::error_code ec;
  while (total < limit) {
    total += socket.read_some(boost::asio::buffer(chunk), ec);
    if (ec) {
      break;
    }
  }
}

SessionRegistry::Config registryConfig(const ServerConfig &config) {
  SessionRegistry::Config out;
  out.session_expiry = config.session_expiry;
  return out;
}

BatchDispatcher::Config dispatcherConfig(const ServerConfig &config) {
  BatchDispatcher::Config out;
  out.worker_pool_width = config.worker_pool_width;
  out.batch_size = config.batch_size;
  out.lookup_timeout = config.lookup_timeout;
  return out;
}

SessionStream::Config streamConfig(const ServerConfig &config) {
  SessionStream::Config out;
  out.heartbeat_interval = config.heartbeat_interval;
  out.max_connection_age = config.max_connection_age;
  return out;
}

PollService::Config pollConfig(const ServerConfig &config) {
  PollService::Config out;
  out.poll_timeout = config.poll_timeout;
  out.poll_batch_size = config.poll_batch_size;
  return out;
}

} // namespace

SearchServer::SearchServer(boost::asio::io_context &ioc,
                           const ServerConfig &config,
                           std::shared_ptr<LookupWorker> worker,
                           std::vector<std::string> items)
    : ioc_(ioc), acceptor_(ioc), config_(config), items_(std::move(items)),
      registry_(registryConfig(config)),
      dispatcher_(std::move(worker), dispatcherConfig(config)),
      stream_(registry_, &dispatcher_, streamConfig(config)),
      poll_service_(registry_, dispatcher_, items_, pollConfig(config)) {
  sweep_thread_ = std::thread(&SearchServer::sweepLoop, this);
}

SearchServer::~SearchServer() { stop(); }

void SearchServer::listen() {
  if (listening_) {
    return;
  }

  beast::error_code ec;
  const tcp::endpoint ep{boost::asio::ip::make_address(config_.bind_address, ec),
                         config_.port};
  if (ec) {
    throw std::runtime_error("Invalid bind address: " + ec.message());
  }
  acceptor_.open(ep.protocol(), ec);
  if (ec) {
    throw std::runtime_error("acceptor open failed: " + ec.message());
  }
  acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  acceptor_.bind(ep, ec);
  if (ec) {
    throw std::runtime_error("bind failed: " + ec.message());
  }
  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("listen failed: " + ec.message());
  }

  port_ = acceptor_.local_endpoint().port();
  listening_ = true;

  DEEPSEARCH_LOG_INFO("Search server listening on " + config_.bind_address +
                      ":" + std::to_string(port_.load()) + " with " +
                      std::to_string(items_.size()) + " reference items");
}

void SearchServer::run() {
  listen();

  while (!stopping_) {
    tcp::socket socket{ioc_};
    beast::error_code ec;
    acceptor_.accept(socket, ec);
    if (stopping_) {
      break;
    }
    if (ec) {
      DEEPSEARCH_LOG_WARNING("accept error: " + ec.message());
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(connections_mutex_);
      ++active_connections_;
    }
    std::thread(&SearchServer::handleConnection, this, std::move(socket))
        .detach();
  }

  beast::error_code ec;
  acceptor_.close(ec);
  DEEPSEARCH_LOG_INFO("Search server stopped accepting connections");
}

void SearchServer::stop() {
  bool expected = false;
  if (!stopping_.compare_exchange_strong(expected, true)) {
    return;
  }

  DEEPSEARCH_LOG_INFO("Stopping search server");

  // Wake a blocking accept() with a connection of our own
  if (listening_) {
    beast::error_code ec;
    auto address = boost::asio::ip::make_address(config_.bind_address, ec);
    if (ec || address.is_unspecified()) {
      address = boost::asio::ip::make_address("127.0.0.1");
    }
    tcp::socket waker{ioc_};
    waker.connect(tcp::endpoint{address, port_.load()}, ec);
    waker.close(ec);
  }

  {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    sweep_cv_.notify_all();
  }
  if (sweep_thread_.joinable()) {
    sweep_thread_.join();
  }

  dispatcher_.stop();

  std::unique_lock<std::mutex> lock(connections_mutex_);
  connections_cv_.wait(lock, [this]() { return active_connections_ == 0; });
}

unsigned short SearchServer::port() const { return port_; }

SessionRegistry &SearchServer::registry() { return registry_; }

void SearchServer::handleConnection(tcp::socket socket) {
  ConnectionGuard guard(connections_mutex_, connections_cv_,
                        active_connections_);

  beast::flat_buffer buffer;
  beast::error_code ec;
  http::request_parser<http::string_body> parser;
  parser.header_limit(static_cast<std::uint32_t>(std::min<std::size_t>(
      config_.max_request_header_bytes,
      std::numeric_limits<std::uint32_t>::max())));
  http::read(socket, buffer, parser, ec);
  if (ec == http::error::header_limit) {
    DEEPSEARCH_LOG_WARNING("Rejected request with headers over " +
                           std::to_string(config_.max_request_header_bytes) +
                           " bytes");
    auto res = errorResponse(http::status::request_header_fields_too_large,
                             types::ErrorCode::InvalidRequest,
                             "Request headers too large", 11);
    http::write(socket, res, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
    drainRequest(socket, 4 * config_.max_request_header_bytes);
    return;
  }
  if (ec) {
    DEEPSEARCH_LOG_DEBUG("http read error: " + ec.message());
    return;
  }
  Request req = parser.release();

  const std::string target = std::string(req.target());
  DEEPSEARCH_LOG_DEBUG(std::string(req.method_string()) + " " + target);

  if (req.method() == http::verb::get &&
      pathOf(target) == "/search/stream" &&
      queryParam(parseQuery(target), "sessionId")) {
    handleStream(socket, req);
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return;
  }

  auto res = handleRequest(req);
  http::write(socket, res, ec);
  if (ec) {
    DEEPSEARCH_LOG_DEBUG("http write error: " + ec.message());
  }
  socket.shutdown(tcp::socket::shutdown_send, ec);
}

void SearchServer::handleStream(tcp::socket &socket, const Request &req) {
  const auto params = parseQuery(std::string(req.target()));
  const std::string session_id = *queryParam(params, "sessionId");

  std::optional<std::size_t> resume_count;
  if (auto value = queryParam(params, "resumeCount")) {
    try {
      resume_count = static_cast<std::size_t>(std::stoul(*value));
    } catch (const std::logic_error &) {
      DEEPSEARCH_LOG_WARNING("Ignoring invalid resumeCount \"" + *value +
                             "\"");
    }
  }

  beast::error_code ec;
  const std::string headers = "HTTP/1.1 200 OK\r\n"
                              "Content-Type: text/event-stream; charset=utf-8\r\n"
                              "Cache-Control: no-cache\r\n"
                              "Connection: close\r\n"
                              "X-Accel-Buffering: no\r\n"
                              "Access-Control-Allow-Origin: *\r\n\r\n";
  boost::asio::write(socket, boost::asio::buffer(headers), ec);
  if (ec) {
    DEEPSEARCH_LOG_WARNING("SSE header write failed: " + ec.message());
    return;
  }

  SocketEventWriter writer(socket);
  auto outcome = stream_.run(writer, session_id, resume_count, &stopping_);
  DEEPSEARCH_LOG_INFO("Stream for session " + session_id +
                      " ended: " + outcomeToString(outcome));
}

Response SearchServer::handleRequest(const Request &req) {
  try {
    if (req.method() == http::verb::options) {
      Response res{http::status::no_content, req.version()};
      setCorsHeaders(res);
      res.set(http::field::access_control_max_age, "86400");
      res.keep_alive(false);
      res.prepare_payload();
      return res;
    }

    const std::string path = pathOf(std::string(req.target()));

    if (req.method() == http::verb::post && path == "/search/session") {
      return handleSessionRequest(req);
    }
    if (req.method() == http::verb::get && path == "/search/poll") {
      return handlePollRequest(req);
    }
    if (req.method() == http::verb::get && path == "/health") {
      return handleHealthRequest(req);
    }
    if (req.method() == http::verb::get && path == "/search/stream") {
      return errorResponse(http::status::bad_request,
                           types::ErrorCode::InvalidRequest,
                           "Missing sessionId parameter", req.version());
    }

    return errorResponse(http::status::not_found,
                         types::ErrorCode::InvalidRequest,
                         "Not found: " + path, req.version());
  } catch (const std::exception &e) {
    DEEPSEARCH_LOG_ERROR(std::string("Request failed: ") + e.what());
    return errorResponse(http::status::internal_server_error,
                         types::ErrorCode::InternalError, e.what(),
                         req.version());
  }
}

Response SearchServer::handleSessionRequest(const Request &req) {
  types::SessionRequest request;
  try {
    request = json_utils::parseSessionRequest(req.body());
  } catch (const ProtocolException &e) {
    DEEPSEARCH_LOG_WARNING(std::string("Rejected session request: ") +
                           e.what());
    return jsonResponse(http::status::bad_request,
                        nlohmann::json{{"error", e.error()}}, req.version());
  }

  std::shared_ptr<SearchSession> session;
  if (request.session_id) {
    session = registry_.registerResume(*request.session_id, request.target,
                                       request.processed_item_ids);
    if (!session) {
      SessionNotFoundException error(*request.session_id);
      return jsonResponse(http::status::not_found,
                          nlohmann::json{{"error", error.error()}},
                          req.version());
    }
  } else {
    session = registry_.createSession(request.target, items_,
                                      request.processed_item_ids);
  }

  return jsonResponse(http::status::ok,
                      {{"sessionId", session->id()},
                       {"message", "Session registered successfully"}},
                      req.version());
}

Response SearchServer::handlePollRequest(const Request &req) {
  const auto params = parseQuery(std::string(req.target()));

  auto target = queryParam(params, "target");
  if (!target) {
    return errorResponse(http::status::bad_request,
                         types::ErrorCode::InvalidRequest,
                         "Missing target parameter", req.version());
  }

  std::vector<std::string> processed;
  if (auto value = queryParam(params, "processed")) {
    processed = json_utils::splitIdList(*value);
  }

  try {
    auto response =
        poll_service_.poll(*target, queryParam(params, "sessionId"), processed);
    return jsonResponse(http::status::ok, response, req.version());
  } catch (const SessionNotFoundException &e) {
    return jsonResponse(http::status::not_found,
                        nlohmann::json{{"error", e.error()}}, req.version());
  } catch (const DeepSearchException &e) {
    auto status = e.error().code == static_cast<int>(types::ErrorCode::Cancelled)
                      ? http::status::conflict
                      : http::status::internal_server_error;
    return jsonResponse(status, nlohmann::json{{"error", e.error()}},
                        req.version());
  }
}

Response SearchServer::handleHealthRequest(const Request &req) {
  return jsonResponse(http::status::ok,
                      {{"status", "healthy"},
                       {"timestamp", isoTimestamp()},
                       {"sessions", registry_.size()}},
                      req.version());
}

void SearchServer::sweepLoop() {
  std::unique_lock<std::mutex> lock(sweep_mutex_);
  while (!stopping_) {
    sweep_cv_.wait_for(lock, config_.sweep_interval,
                       [this]() { return stopping_.load(); });
    if (stopping_) {
      break;
    }

    auto dropped = registry_.expire(SearchSession::Clock::now());
    if (dropped > 0) {
      DEEPSEARCH_LOG_INFO("Expired " + std::to_string(dropped) +
                          " idle sessions");
    }
  }
}

} // namespace server
} // namespace deepsearch
