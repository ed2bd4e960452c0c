#ifndef DEEPSEARCH_CONFIG_HPP_
#define DEEPSEARCH_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace deepsearch {

/**
 * @brief How the server investigates items
 */
enum class LookupMode {
  Simulated, ///< Deterministic local results, no network
  Chat       ///< OpenAI-compatible chat completion endpoint
};

/**
 * @brief Server configuration
 */
struct ServerConfig {
  std::string bind_address = "0.0.0.0";
  unsigned short port = 5000;

  /**
   * @brief Largest accepted request header block; poll requests carry every
   * processed id in the query string
   */
  std::size_t max_request_header_bytes = 1024 * 1024;

  // Dispatcher
  std::size_t worker_pool_width = 5;
  std::size_t batch_size = 5;
  std::chrono::milliseconds lookup_timeout{120000};

  // Stream transport
  std::chrono::milliseconds heartbeat_interval{5000};
  std::chrono::milliseconds max_connection_age{240000};

  // Session registry
  std::chrono::milliseconds session_expiry{30 * 60 * 1000};
  std::chrono::milliseconds sweep_interval{60000};

  // Fallback poller
  std::chrono::milliseconds poll_timeout{25000};
  std::size_t poll_batch_size = 10;

  // Lookup
  std::string reference_list_path = "reference_list.json";
  LookupMode lookup_mode = LookupMode::Simulated;
  std::string chat_endpoint = "https://openrouter.ai/api/v1/chat/completions";
  std::string chat_model = "google/gemini-2.5-pro-preview";
  std::string chat_api_key;
  std::chrono::milliseconds simulated_latency{500};
  double simulated_failure_rate = 0.0;

  /**
   * @brief Build a configuration from DEEPSEARCH_* environment variables
   *
   * Unset variables keep their defaults.
   *
   * @return ServerConfig The configuration
   * @throws std::invalid_argument if a variable holds an invalid value
   */
  static ServerConfig fromEnvironment();
};

/**
 * @brief Client configuration
 */
struct ClientConfig {
  std::string base_url = "http://127.0.0.1:5000";
  std::chrono::milliseconds connect_timeout{10000};

  std::size_t max_reconnect_attempts = 5;
  std::chrono::milliseconds reconnect_delay{1000};
  std::chrono::milliseconds max_reconnect_backoff{30000};
  std::chrono::milliseconds inactivity_timeout{60000};
  std::chrono::milliseconds max_connection_age{285000};

  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds poll_timeout{30000};
  std::size_t max_poll_failures = 5;

  /**
   * @brief Build a configuration from DEEPSEARCH_* environment variables
   *
   * @return ClientConfig The configuration
   * @throws std::invalid_argument if a variable holds an invalid value
   */
  static ClientConfig fromEnvironment();
};

LookupMode lookupModeFromString(const std::string &value);

/**
 * @brief Load the reference list a target is checked against
 *
 * The file holds a JSON array of strings, or of objects whose name is stored
 * under "name", "Name", "institution" or "Institution" (the first key of the
 * first object otherwise).
 *
 * @param path Path of the JSON file
 * @return std::vector<std::string> The item names
 * @throws std::runtime_error if the file cannot be read or has another shape
 */
std::vector<std::string> loadReferenceList(const std::string &path);

} // namespace deepsearch

#endif // DEEPSEARCH_CONFIG_HPP_
