#ifndef DEEPSEARCH_UTILS_JSON_UTILS_HPP_
#define DEEPSEARCH_UTILS_JSON_UTILS_HPP_

#include "deepsearch/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace deepsearch {
namespace json_utils {

/**
 * @brief Validate JSON against a schema
 *
 * @param json The JSON value to validate
 * @param schema The JSON schema to validate against
 * @param error_msg Optional output parameter for error message
 * @return true if validation succeeded, false otherwise
 */
bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg = nullptr);

/**
 * @brief Parse a JSON string
 *
 * @param json_str The JSON string to parse
 * @return nlohmann::json The parsed JSON
 * @throws TransportException if parsing fails
 */
nlohmann::json parse(const std::string &json_str);

/**
 * @brief Parse a stream event from the payload of an SSE data line
 *
 * @param json_str The JSON string to parse
 * @return types::StreamEvent The parsed event
 * @throws TransportException if the payload is not JSON
 * @throws ProtocolException if the payload is not a known stream event
 */
types::StreamEvent parseEvent(const std::string &json_str);

/**
 * @brief Serialize a stream event to a single-line JSON string
 */
std::string serializeEvent(const types::StreamEvent &event);

/**
 * @brief Build an SSE frame ("data: <json>\n\n") for an event
 */
std::string sseFrame(const types::StreamEvent &event);

/**
 * @brief JSON schema of the POST /search/session body
 */
const nlohmann::json &sessionRequestSchema();

/**
 * @brief Parse and validate the body of a session registration
 *
 * @param body The raw request body
 * @return types::SessionRequest The request
 * @throws ProtocolException with ErrorCode::InvalidRequest if the body does
 * not match the schema
 */
types::SessionRequest parseSessionRequest(const std::string &body);

/**
 * @brief Split a comma-separated id list, dropping empty entries
 *
 * Entries produced by joinIdList() have "%" and "," escaped as "%25" and
 * "%2C"; both are restored here.
 */
std::vector<std::string> splitIdList(const std::string &csv);

/**
 * @brief Join ids into a comma-separated list
 */
std::string joinIdList(const std::vector<std::string> &ids);

} // namespace json_utils
} // namespace deepsearch

#endif // DEEPSEARCH_UTILS_JSON_UTILS_HPP_
