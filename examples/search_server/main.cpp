#include "deepsearch/config.hpp"
#include "deepsearch/server/lookup_worker.hpp"
#include "deepsearch/server/search_server.hpp"
#include "deepsearch/utils/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <signal.h>
#include <string>
#include <thread>

using namespace deepsearch;
using namespace deepsearch::server;

// Global flag for graceful shutdown
std::atomic<bool> g_running(true);

// Signal handler for graceful shutdown
void signal_handler(int signal) { g_running = false; }

int main(int argc, char **argv) {
  // Set up signal handling
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  // Configure logging
  logging::setLevel(logging::Level::Info);
  if (const char *level = std::getenv("DEEPSEARCH_LOG_LEVEL")) {
    try {
      logging::setLevel(logging::levelFromString(level));
    } catch (const std::invalid_argument &e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
  }

  ServerConfig config;
  std::vector<std::string> items;
  try {
    config = ServerConfig::fromEnvironment();
    if (argc > 1) {
      config.reference_list_path = argv[1];
    }
    items = loadReferenceList(config.reference_list_path);
  } catch (const std::exception &e) {
    DEEPSEARCH_LOG_FATAL(std::string("Failed to load configuration: ") +
                         e.what());
    return 1;
  }

  // Pick the lookup worker
  std::shared_ptr<LookupWorker> worker;
  if (config.lookup_mode == LookupMode::Chat) {
    if (config.chat_api_key.empty()) {
      DEEPSEARCH_LOG_WARNING("DEEPSEARCH_CHAT_API_KEY is not set");
    }
    ChatCompletionLookupWorker::Config chat_config;
    chat_config.endpoint_url = config.chat_endpoint;
    chat_config.api_key = config.chat_api_key;
    chat_config.model = config.chat_model;
    worker = std::make_shared<ChatCompletionLookupWorker>(chat_config);
    DEEPSEARCH_LOG_INFO("Using chat completion lookups with model " +
                        config.chat_model);
  } else {
    SimulatedLookupWorker::Config simulated_config;
    simulated_config.latency = config.simulated_latency;
    simulated_config.failure_rate = config.simulated_failure_rate;
    worker = std::make_shared<SimulatedLookupWorker>(simulated_config);
    DEEPSEARCH_LOG_INFO("Using simulated lookups");
  }

  std::cout << "Deep Search Server" << std::endl;
  std::cout << "Press Ctrl+C to exit" << std::endl;

  boost::asio::io_context ioc;
  SearchServer server(ioc, config, worker, std::move(items));

  try {
    server.listen();
  } catch (const std::exception &e) {
    DEEPSEARCH_LOG_FATAL(std::string("Failed to start server: ") + e.what());
    return 1;
  }

  // Stop the server once a signal arrives
  std::thread watcher([&server]() {
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    server.stop();
  });

  server.run();

  g_running = false;
  watcher.join();

  DEEPSEARCH_LOG_INFO("Search server shut down");
  return 0;
}
