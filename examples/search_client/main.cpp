#include "deepsearch/client/http_sse_connection.hpp"
#include "deepsearch/client/search_api.hpp"
#include "deepsearch/client/stream_manager.hpp"
#include "deepsearch/config.hpp"
#include "deepsearch/utils/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <signal.h>
#include <string>
#include <thread>

using namespace deepsearch;
using namespace deepsearch::client;

// Global flag for graceful shutdown
std::atomic<bool> g_running(true);

// Signal handler for graceful shutdown
void signal_handler(int signal) { g_running = false; }

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <target> [session-id]" << std::endl;
    return 1;
  }

  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  logging::setLevel(logging::Level::Warning);
  if (const char *level = std::getenv("DEEPSEARCH_LOG_LEVEL")) {
    try {
      logging::setLevel(logging::levelFromString(level));
    } catch (const std::invalid_argument &e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
  }

  ClientConfig config;
  try {
    config = ClientConfig::fromEnvironment();
  } catch (const std::exception &e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  const std::string target = argv[1];
  std::optional<std::string> session_id;
  if (argc > 2) {
    session_id = argv[2];
  }

  CurlSearchApi::Config api_config;
  api_config.base_url = config.base_url;
  api_config.connect_timeout = config.connect_timeout;
  api_config.request_timeout = config.poll_timeout;
  auto api = std::make_shared<CurlSearchApi>(api_config);

  HttpSseConnection::Config connection_config;
  connection_config.base_url = config.base_url;
  connection_config.connect_timeout = config.connect_timeout;
  StreamConnectionFactory factory = [connection_config]() {
    return std::make_unique<HttpSseConnection>(connection_config);
  };

  StreamManager::Config manager_config;
  manager_config.machine.max_reconnect_attempts =
      static_cast<int>(config.max_reconnect_attempts);
  manager_config.machine.reconnect_delay = config.reconnect_delay;
  manager_config.machine.max_reconnect_backoff = config.max_reconnect_backoff;
  manager_config.machine.poll_interval = config.poll_interval;
  manager_config.machine.poll_retry_delay = config.reconnect_delay;
  manager_config.machine.max_poll_failures =
      static_cast<int>(config.max_poll_failures);
  manager_config.inactivity_timeout = config.inactivity_timeout;
  manager_config.max_connection_age = config.max_connection_age;

  StreamManager manager(api, factory, manager_config);

  std::atomic<bool> done(false);
  std::atomic<int> exit_code(0);

  manager.setResultCallback([](const types::WorkResult &result) {
    std::cout << result.item_id << ": "
              << types::relationshipTypeToString(result.relationship_type)
              << std::endl;
    if (!result.summary.empty()) {
      std::cout << "  " << result.summary << std::endl;
    }
  });

  manager.setProgressCallback([](std::size_t processed, std::size_t total) {
    std::cerr << "Progress: " << processed << "/" << total << std::endl;
  });

  manager.setPhaseCallback([&manager](Phase phase) {
    if (phase == Phase::Connected) {
      std::cerr << "Connected, session " << manager.sessionId() << std::endl;
    } else if (phase == Phase::FallbackMode) {
      std::cerr << "Streaming unavailable, polling instead" << std::endl;
    }
  });

  manager.setCompleteCallback(
      [&done](const std::vector<types::WorkResult> &results) {
        std::cout << "Search complete: " << results.size() << " results"
                  << std::endl;
        done = true;
      });

  manager.setErrorCallback([&done, &exit_code, &manager](
                               FailureKind kind, const std::string &message,
                               bool recoverable) {
    std::cerr << "Search failed: " << message << std::endl;
    if (kind == FailureKind::SessionNotFound) {
      std::cerr << "Session " << manager.sessionId()
                << " is gone; run again without a session id" << std::endl;
    } else if (recoverable) {
      std::cerr << "Run again with session id " << manager.sessionId()
                << " to resume" << std::endl;
    }
    exit_code = 2;
    done = true;
  });

  manager.start(target, session_id);

  while (g_running && !done) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (!done) {
    const std::string last_session = manager.sessionId();
    manager.cancel();
    std::cerr << "Cancelled; resume with session id " << last_session
              << std::endl;
    exit_code = 130;
  }

  return exit_code.load();
}
