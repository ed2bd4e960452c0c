#ifndef DEEPSEARCH_TYPES_HPP_
#define DEEPSEARCH_TYPES_HPP_

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace deepsearch {
namespace types {

/**
 * @brief Error codes shared by the server, the wire protocol and the client
 */
enum class ErrorCode {
  ParseError = -32700,     ///< Invalid JSON was received
  InvalidRequest = -32600, ///< The request is missing or has invalid fields
  InternalError = -32603,  ///< Unexpected server-side failure

  ProtocolError = -32000,     ///< Malformed stream event or response
  TransportError = -32001,    ///< Network or HTTP failure
  TimeoutError = -32002,      ///< Operation timed out
  SessionNotFound = -32010,   ///< Session id is unknown or expired
  FallbackExhausted = -32011, ///< Polling failed too many times in a row
  Cancelled = -32012          ///< Session was cancelled
};

/**
 * @brief Structure describing an error
 */
struct ErrorData {
  int code;            ///< Error code
  std::string message; ///< Error message
  nlohmann::json data; ///< Optional additional error data
};

/**
 * @brief Classification of the relationship between a target and an item
 */
enum class RelationshipType {
  Direct,
  Indirect,
  SignificantMention,
  Unknown,
  NoEvidenceFound
};

/**
 * @brief Convert a relationship type to its wire string
 *
 * @param type The relationship type
 * @return std::string "Direct", "Indirect", "Significant Mention", "Unknown"
 * or "No Evidence Found"
 */
std::string relationshipTypeToString(RelationshipType type);

/**
 * @brief Parse a relationship type from its wire string
 *
 * Unrecognised strings map to RelationshipType::Unknown.
 *
 * @param value The wire string
 * @return RelationshipType The relationship type
 */
RelationshipType relationshipTypeFromString(const std::string &value);

/**
 * @brief Lifecycle of a search session. Transitions only move forward.
 */
enum class SessionStatus { Pending, Running, Completed, Cancelled, Failed };

std::string sessionStatusToString(SessionStatus status);

/**
 * @brief Check whether a status is terminal (Completed, Cancelled or Failed)
 */
bool isTerminal(SessionStatus status);

/**
 * @brief Terminal result of one item lookup
 */
struct WorkResult {
  std::string item_id; ///< Reference-list entry the result belongs to
  RelationshipType relationship_type = RelationshipType::Unknown;
  std::string summary;                     ///< Finding summary
  std::vector<std::string> intermediaries; ///< Potential intermediaries
  std::vector<std::string> sources;        ///< Source URLs
};

/**
 * @brief First event of every stream connection
 */
struct InitEvent {
  std::size_t total = 0;    ///< Number of items in the session
  std::size_t progress = 0; ///< Items already completed on the server
  std::string session_id;
  std::size_t total_batches = 0;
};

/**
 * @brief Sent when the dispatcher moves to a new batch
 */
struct BatchInfoEvent {
  std::size_t current_batch = 0; ///< 1-based batch index
  std::size_t total_batches = 0;
};

/**
 * @brief Periodic liveness event carrying authoritative progress
 */
struct HeartbeatEvent {
  std::size_t progress = 0;
  std::size_t total = 0;
  std::vector<std::string> completed_ids; ///< Ids completed on the server
};

struct ResultEvent {
  WorkResult result;
};

/**
 * @brief Sent before the server ends a connection that is about to reach the
 * platform connection-duration ceiling
 */
struct ReconnectWarningEvent {
  std::string session_id;
  std::string target;
  std::size_t resume_hint = 0; ///< Server completed count
  std::vector<std::string> completed_ids;
};

struct ErrorEvent {
  std::string message;
  bool fatal = false;
  int code = static_cast<int>(ErrorCode::InternalError);
};

struct CompleteEvent {};

/**
 * @brief Closed set of events a stream can carry
 */
using StreamEvent =
    std::variant<InitEvent, BatchInfoEvent, HeartbeatEvent, ResultEvent,
                 ReconnectWarningEvent, ErrorEvent, CompleteEvent>;

/**
 * @brief Wire name of the event held by a StreamEvent
 */
std::string eventTypeName(const StreamEvent &event);

/**
 * @brief Body of POST /search/session
 */
struct SessionRequest {
  std::string target;
  std::optional<std::string> session_id;
  std::vector<std::string> processed_item_ids;
};

/**
 * @brief Body returned by GET /search/poll
 */
struct PollResponse {
  std::vector<WorkResult> results; ///< Results the caller had not processed
  std::size_t processed = 0;       ///< Items completed on the server
  std::size_t total = 0;           ///< Items in the session
  std::string session_id;          ///< Session the poll was served from
};

} // namespace types
} // namespace deepsearch

// JSON serialization/deserialization functions
namespace nlohmann {

template <> struct adl_serializer<deepsearch::types::ErrorData> {
  static void to_json(json &j, const deepsearch::types::ErrorData &error) {
    j = json{{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
      j["data"] = error.data;
    }
  }

  static void from_json(const json &j, deepsearch::types::ErrorData &error) {
    j.at("code").get_to(error.code);
    j.at("message").get_to(error.message);
    error.data = j.contains("data") ? j["data"] : json(nullptr);
  }
};

template <> struct adl_serializer<deepsearch::types::RelationshipType> {
  static void to_json(json &j, const deepsearch::types::RelationshipType &type) {
    j = deepsearch::types::relationshipTypeToString(type);
  }

  static void from_json(const json &j,
                        deepsearch::types::RelationshipType &type) {
    type = j.is_string()
               ? deepsearch::types::relationshipTypeFromString(
                     j.get<std::string>())
               : deepsearch::types::RelationshipType::Unknown;
  }
};

template <> struct adl_serializer<deepsearch::types::WorkResult> {
  static void to_json(json &j, const deepsearch::types::WorkResult &result) {
    j = json::object();
    j["item_id"] = result.item_id;
    j["relationship_type"] = result.relationship_type;
    j["summary"] = result.summary;
    j["intermediaries"] = result.intermediaries;
    j["sources"] = result.sources;
  }

  static void from_json(const json &j, deepsearch::types::WorkResult &result) {
    j.at("item_id").get_to(result.item_id);
    result.relationship_type =
        j.value("relationship_type", deepsearch::types::RelationshipType::Unknown);
    result.summary = j.value("summary", std::string());
    result.intermediaries =
        j.value("intermediaries", std::vector<std::string>());
    result.sources = j.value("sources", std::vector<std::string>());
  }
};

template <> struct adl_serializer<deepsearch::types::SessionRequest> {
  static void to_json(json &j,
                      const deepsearch::types::SessionRequest &request) {
    j = json::object();
    j["target"] = request.target;
    if (request.session_id) {
      j["sessionId"] = *request.session_id;
    }
    j["processedItemIds"] = request.processed_item_ids;
  }

  static void from_json(const json &j,
                        deepsearch::types::SessionRequest &request) {
    j.at("target").get_to(request.target);
    if (j.contains("sessionId") && j["sessionId"].is_string() &&
        !j["sessionId"].get<std::string>().empty()) {
      request.session_id = j["sessionId"].get<std::string>();
    } else {
      request.session_id.reset();
    }
    request.processed_item_ids =
        j.value("processedItemIds", std::vector<std::string>());
  }
};

template <> struct adl_serializer<deepsearch::types::PollResponse> {
  static void to_json(json &j, const deepsearch::types::PollResponse &poll) {
    j = json::object();
    j["results"] = poll.results;
    j["processed"] = poll.processed;
    j["total"] = poll.total;
    j["sessionId"] = poll.session_id;
  }

  static void from_json(const json &j, deepsearch::types::PollResponse &poll) {
    j.at("results").get_to(poll.results);
    j.at("processed").get_to(poll.processed);
    j.at("total").get_to(poll.total);
    poll.session_id = j.value("sessionId", std::string());
  }
};

// StreamEvent serialization, discriminated by the "type" field
template <> struct adl_serializer<deepsearch::types::StreamEvent> {
  static void to_json(json &j, const deepsearch::types::StreamEvent &event) {
    using namespace deepsearch::types;

    j = json::object();
    j["type"] = eventTypeName(event);

    std::visit(
        [&j](const auto &e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, InitEvent>) {
            j["total"] = e.total;
            j["progress"] = e.progress;
            j["sessionId"] = e.session_id;
            j["totalBatches"] = e.total_batches;
          } else if constexpr (std::is_same_v<T, BatchInfoEvent>) {
            j["currentBatch"] = e.current_batch;
            j["totalBatches"] = e.total_batches;
          } else if constexpr (std::is_same_v<T, HeartbeatEvent>) {
            j["progress"] = e.progress;
            j["total"] = e.total;
            j["completedIds"] = e.completed_ids;
          } else if constexpr (std::is_same_v<T, ResultEvent>) {
            j["result"] = e.result;
          } else if constexpr (std::is_same_v<T, ReconnectWarningEvent>) {
            j["sessionId"] = e.session_id;
            j["target"] = e.target;
            j["resumeHint"] = e.resume_hint;
            j["completedIds"] = e.completed_ids;
          } else if constexpr (std::is_same_v<T, ErrorEvent>) {
            j["message"] = e.message;
            j["fatal"] = e.fatal;
            j["code"] = e.code;
          } else {
            static_assert(std::is_same_v<T, CompleteEvent>,
                          "unhandled stream event");
          }
        },
        event);
  }

  static void from_json(const json &j, deepsearch::types::StreamEvent &event) {
    using namespace deepsearch::types;

    const auto type = j.at("type").get<std::string>();

    if (type == "init") {
      InitEvent e;
      j.at("total").get_to(e.total);
      e.progress = j.value("progress", std::size_t{0});
      e.session_id = j.value("sessionId", std::string());
      e.total_batches = j.value("totalBatches", std::size_t{0});
      event = e;
    } else if (type == "batch_info") {
      BatchInfoEvent e;
      j.at("currentBatch").get_to(e.current_batch);
      j.at("totalBatches").get_to(e.total_batches);
      event = e;
    } else if (type == "heartbeat") {
      HeartbeatEvent e;
      j.at("progress").get_to(e.progress);
      j.at("total").get_to(e.total);
      e.completed_ids = j.value("completedIds", std::vector<std::string>());
      event = e;
    } else if (type == "result") {
      event = ResultEvent{j.at("result").get<WorkResult>()};
    } else if (type == "reconnect_warning") {
      ReconnectWarningEvent e;
      j.at("sessionId").get_to(e.session_id);
      e.target = j.value("target", std::string());
      e.resume_hint = j.value("resumeHint", std::size_t{0});
      e.completed_ids = j.value("completedIds", std::vector<std::string>());
      event = e;
    } else if (type == "error") {
      ErrorEvent e;
      j.at("message").get_to(e.message);
      e.fatal = j.value("fatal", false);
      e.code = j.value("code", static_cast<int>(ErrorCode::InternalError));
      event = e;
    } else if (type == "complete") {
      event = CompleteEvent{};
    } else {
      throw std::invalid_argument("Unknown stream event type: " + type);
    }
  }
};

} // namespace nlohmann

#endif // DEEPSEARCH_TYPES_HPP_
