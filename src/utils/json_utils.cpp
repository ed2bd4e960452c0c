#include "deepsearch/utils/json_utils.hpp"
#include "deepsearch/utils/error.hpp"
#include <nlohmann/json-schema.hpp>
#include <sstream>

namespace deepsearch {
namespace json_utils {

bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg) {
  try {
    nlohmann::json_schema::json_validator validator;
    validator.set_root_schema(schema);
    validator.validate(json);
    return true;
  } catch (const std::exception &e) {
    if (error_msg) {
      *error_msg = e.what();
    }
    return false;
  }
}

nlohmann::json parse(const std::string &json_str) {
  try {
    return nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error &e) {
    throw TransportException("JSON parse error: " + std::string(e.what()));
  }
}

types::StreamEvent parseEvent(const std::string &json_str) {
  nlohmann::json json = parse(json_str);

  if (!json.is_object() || !json.contains("type") ||
      !json["type"].is_string()) {
    throw ProtocolException("Invalid stream event: missing type");
  }

  try {
    return json.get<types::StreamEvent>();
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolException("Stream event parse error: " +
                            std::string(e.what()));
  } catch (const std::invalid_argument &e) {
    throw ProtocolException(e.what(), {{"type", json["type"]}});
  }
}

std::string serializeEvent(const types::StreamEvent &event) {
  return nlohmann::json(event).dump();
}

std::string sseFrame(const types::StreamEvent &event) {
  return "data: " + serializeEvent(event) + "\n\n";
}

const nlohmann::json &sessionRequestSchema() {
  static const nlohmann::json schema = R"({
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "properties": {
      "target": {"type": "string", "minLength": 1},
      "sessionId": {"type": ["string", "null"]},
      "processedItemIds": {"type": "array", "items": {"type": "string"}}
    },
    "required": ["target"]
  })"_json;
  return schema;
}

types::SessionRequest parseSessionRequest(const std::string &body) {
  nlohmann::json json;
  try {
    json = parse(body);
  } catch (const TransportException &e) {
    throw ProtocolException(types::ErrorCode::ParseError, e.what());
  }

  std::string error;
  if (!validate(json, sessionRequestSchema(), &error)) {
    throw ProtocolException(types::ErrorCode::InvalidRequest,
                            "Invalid session request: " + error);
  }

  try {
    return json.get<types::SessionRequest>();
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolException(types::ErrorCode::InvalidRequest,
                            "Invalid session request: " +
                                std::string(e.what()));
  }
}

namespace {
// Ids may themselves contain commas, so each entry escapes '%' and ','
std::string escapeId(const std::string &id) {
  std::string escaped;
  for (char c : id) {
    if (c == '%') {
      escaped += "%25";
    } else if (c == ',') {
      escaped += "%2C";
    } else {
      escaped += c;
    }
  }
  return escaped;
}

std::string unescapeId(const std::string &id) {
  std::string unescaped;
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (id[i] == '%' && i + 2 < id.size()) {
      const std::string code = id.substr(i + 1, 2);
      if (code == "25") {
        unescaped += '%';
        i += 2;
        continue;
      }
      if (code == "2C" || code == "2c") {
        unescaped += ',';
        i += 2;
        continue;
      }
    }
    unescaped += id[i];
  }
  return unescaped;
}
} // namespace

std::vector<std::string> splitIdList(const std::string &csv) {
  std::vector<std::string> ids;
  std::stringstream ss(csv);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      ids.push_back(unescapeId(item));
    }
  }
  return ids;
}

std::string joinIdList(const std::vector<std::string> &ids) {
  std::string joined;
  for (const auto &id : ids) {
    if (!joined.empty()) {
      joined += ',';
    }
    joined += escapeId(id);
  }
  return joined;
}

} // namespace json_utils
} // namespace deepsearch
