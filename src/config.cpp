#include "deepsearch/config.hpp"
#include "deepsearch/utils/logging.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace deepsearch {

namespace {

const char *env(const char *name) {
  const char *value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

std::size_t parseCount(const char *name, const std::string &value) {
  try {
    std::size_t pos = 0;
    long long parsed = std::stoll(value, &pos);
    if (pos != value.size() || parsed < 0) {
      throw std::invalid_argument(value);
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(std::string("Invalid value for ") + name +
                                ": " + value);
  }
}

void readCount(const char *name, std::size_t &out) {
  if (const char *value = env(name)) {
    out = parseCount(name, value);
  }
}

void readMillis(const char *name, std::chrono::milliseconds &out) {
  if (const char *value = env(name)) {
    out = std::chrono::milliseconds(parseCount(name, value));
  }
}

void readString(const char *name, std::string &out) {
  if (const char *value = env(name)) {
    out = value;
  }
}

} // namespace

LookupMode lookupModeFromString(const std::string &value) {
  if (value == "simulated" || value == "test") {
    return LookupMode::Simulated;
  } else if (value == "chat") {
    return LookupMode::Chat;
  }
  throw std::invalid_argument("Invalid lookup mode: " + value);
}

ServerConfig ServerConfig::fromEnvironment() {
  ServerConfig config;

  readString("DEEPSEARCH_BIND_ADDRESS", config.bind_address);
  if (const char *value = env("DEEPSEARCH_PORT")) {
    std::size_t port = parseCount("DEEPSEARCH_PORT", value);
    if (port > 65535) {
      throw std::invalid_argument(std::string("Invalid value for "
                                              "DEEPSEARCH_PORT: ") +
                                  value);
    }
    config.port = static_cast<unsigned short>(port);
  }

  readCount("DEEPSEARCH_MAX_REQUEST_HEADER_BYTES",
            config.max_request_header_bytes);
  readCount("DEEPSEARCH_WORKER_POOL_WIDTH", config.worker_pool_width);
  readCount("DEEPSEARCH_BATCH_SIZE", config.batch_size);
  readMillis("DEEPSEARCH_LOOKUP_TIMEOUT_MS", config.lookup_timeout);
  readMillis("DEEPSEARCH_HEARTBEAT_INTERVAL_MS", config.heartbeat_interval);
  readMillis("DEEPSEARCH_MAX_CONNECTION_AGE_MS", config.max_connection_age);
  readMillis("DEEPSEARCH_SESSION_EXPIRY_MS", config.session_expiry);
  readMillis("DEEPSEARCH_SWEEP_INTERVAL_MS", config.sweep_interval);
  readMillis("DEEPSEARCH_POLL_TIMEOUT_MS", config.poll_timeout);
  readCount("DEEPSEARCH_POLL_BATCH_SIZE", config.poll_batch_size);

  readString("DEEPSEARCH_REFERENCE_LIST", config.reference_list_path);
  if (const char *value = env("DEEPSEARCH_LOOKUP_MODE")) {
    config.lookup_mode = lookupModeFromString(value);
  }
  readString("DEEPSEARCH_CHAT_ENDPOINT", config.chat_endpoint);
  readString("DEEPSEARCH_CHAT_MODEL", config.chat_model);
  readString("DEEPSEARCH_CHAT_API_KEY", config.chat_api_key);
  readMillis("DEEPSEARCH_SIMULATED_LATENCY_MS", config.simulated_latency);

  if (const char *value = env("DEEPSEARCH_SIMULATED_FAILURE_RATE")) {
    try {
      std::size_t pos = 0;
      double rate = std::stod(value, &pos);
      if (pos != std::string(value).size() || rate < 0.0 || rate > 1.0) {
        throw std::invalid_argument(value);
      }
      config.simulated_failure_rate = rate;
    } catch (const std::logic_error &) {
      throw std::invalid_argument(
          std::string("Invalid value for DEEPSEARCH_SIMULATED_FAILURE_RATE: ") +
          value);
    }
  }

  if (config.worker_pool_width == 0 || config.batch_size == 0) {
    throw std::invalid_argument(
        "Worker pool width and batch size must be positive");
  }

  return config;
}

ClientConfig ClientConfig::fromEnvironment() {
  ClientConfig config;

  readString("DEEPSEARCH_BASE_URL", config.base_url);
  readMillis("DEEPSEARCH_CONNECT_TIMEOUT_MS", config.connect_timeout);
  readCount("DEEPSEARCH_MAX_RECONNECT_ATTEMPTS", config.max_reconnect_attempts);
  readMillis("DEEPSEARCH_RECONNECT_DELAY_MS", config.reconnect_delay);
  readMillis("DEEPSEARCH_MAX_RECONNECT_BACKOFF_MS",
             config.max_reconnect_backoff);
  readMillis("DEEPSEARCH_INACTIVITY_TIMEOUT_MS", config.inactivity_timeout);
  readMillis("DEEPSEARCH_CLIENT_MAX_CONNECTION_AGE_MS",
             config.max_connection_age);
  readMillis("DEEPSEARCH_POLL_INTERVAL_MS", config.poll_interval);
  readMillis("DEEPSEARCH_CLIENT_POLL_TIMEOUT_MS", config.poll_timeout);
  readCount("DEEPSEARCH_MAX_POLL_FAILURES", config.max_poll_failures);

  return config;
}

std::vector<std::string> loadReferenceList(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("Cannot open reference list: " + path);
  }

  nlohmann::json data;
  try {
    file >> data;
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Invalid reference list " + path + ": " +
                             e.what());
  }

  if (!data.is_array()) {
    throw std::runtime_error("Reference list must be a JSON array: " + path);
  }

  std::vector<std::string> items;
  if (data.empty()) {
    return items;
  }

  if (data.front().is_string()) {
    for (const auto &entry : data) {
      if (entry.is_string()) {
        items.push_back(entry.get<std::string>());
      }
    }
    return items;
  }

  if (!data.front().is_object() || data.front().empty()) {
    throw std::runtime_error("Unsupported reference list entry in " + path);
  }

  std::string name_field;
  for (const char *candidate : {"name", "Name", "institution", "Institution"}) {
    if (data.front().contains(candidate)) {
      name_field = candidate;
      break;
    }
  }
  if (name_field.empty()) {
    name_field = data.front().begin().key();
    DEEPSEARCH_LOG_WARNING("Reference list has no name field, using \"" +
                           name_field + "\"");
  }

  for (const auto &entry : data) {
    if (entry.is_object() && entry.contains(name_field) &&
        entry[name_field].is_string()) {
      items.push_back(entry[name_field].get<std::string>());
    }
  }

  DEEPSEARCH_LOG_INFO("Loaded " + std::to_string(items.size()) +
                      " reference items from " + path);
  return items;
}

} // namespace deepsearch
