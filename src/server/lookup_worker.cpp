#include "deepsearch/server/lookup_worker.hpp"
#include "deepsearch/utils/error.hpp"
#include "deepsearch/utils/json_utils.hpp"
#include "deepsearch/utils/logging.hpp"

#include <cctype>
#include <curl/curl.h>
#include <functional>
#include <mutex>
#include <random>
#include <thread>

namespace deepsearch {
namespace server {

namespace {

const char *const kDirectFindings[] = {
    "Joint research projects and co-authored publications link the two "
    "organisations directly.",
    "A formal cooperation agreement covering staff exchange and shared "
    "resources was found.",
    "Funding records show the item financing work at the target."};

const char *const kIndirectFindings[] = {
    "Both organisations belong to the same research consortium, with no "
    "direct collaboration found.",
    "A shared partner connects the two organisations; no direct agreement "
    "was found.",
    "Both took part in the same international programme without direct "
    "interaction."};

const char *const kMentionFindings[] = {
    "The target's publications cite the item repeatedly.",
    "Researchers at the target frequently reference the item's work.",
    "The item is named in the target's strategy documents."};

const char *const kNoEvidenceFindings[] = {
    "No cooperation, connection or notable mention was found.",
    "Public sources show no link between the two organisations.",
    "A broad search found no information relating the two organisations."};

std::string slug(const std::string &value) {
  std::string out;
  for (char c : value) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else if (!out.empty() && out.back() != '-') {
      out += '-';
    }
  }
  while (!out.empty() && out.back() == '-') {
    out.pop_back();
  }
  return out;
}

size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *response = static_cast<std::string *>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

std::string stripPromptCharacters(const std::string &value) {
  std::string out;
  for (char c : value) {
    if (c != '\\' && c != '"') {
      out += c;
    }
  }
  return out;
}

std::vector<std::string> readSources(const nlohmann::json &value) {
  std::vector<std::string> sources;
  if (!value.is_array()) {
    return sources;
  }
  for (const auto &entry : value) {
    if (entry.is_string()) {
      sources.push_back(entry.get<std::string>());
    } else if (entry.is_object() && entry.contains("url") &&
               entry["url"].is_string()) {
      sources.push_back(entry["url"].get<std::string>());
    }
  }
  return sources;
}

} // namespace

SimulatedLookupWorker::SimulatedLookupWorker(const Config &config)
    : config_(config) {}

types::WorkResult SimulatedLookupWorker::investigate(const std::string &target,
                                                     const std::string &item) {
  if (config_.latency.count() > 0) {
    std::this_thread::sleep_for(config_.latency);
  }

  std::mt19937 rng(
      static_cast<std::mt19937::result_type>(
          std::hash<std::string>{}(target + ":" + item)));

  std::uniform_real_distribution<double> failure(0.0, 1.0);
  if (failure(rng) < config_.failure_rate) {
    throw std::runtime_error("Simulated lookup failure for " + item);
  }

  // Direct, Indirect, Significant Mention, No Evidence Found
  std::discrete_distribution<int> kind({10, 15, 15, 60});
  std::uniform_int_distribution<int> finding(0, 2);

  types::WorkResult result;
  result.item_id = item;

  switch (kind(rng)) {
  case 0:
    result.relationship_type = types::RelationshipType::Direct;
    result.summary = kDirectFindings[finding(rng)];
    break;
  case 1:
    result.relationship_type = types::RelationshipType::Indirect;
    result.summary = kIndirectFindings[finding(rng)];
    result.intermediaries.push_back("Consortium of " + item);
    break;
  case 2:
    result.relationship_type = types::RelationshipType::SignificantMention;
    result.summary = kMentionFindings[finding(rng)];
    break;
  default:
    result.relationship_type = types::RelationshipType::NoEvidenceFound;
    result.summary = kNoEvidenceFindings[finding(rng)];
    break;
  }

  if (result.relationship_type != types::RelationshipType::NoEvidenceFound) {
    result.sources.push_back("https://example.org/" + slug(target) + "/" +
                             slug(item));
  }

  return result;
}

ChatCompletionLookupWorker::ChatCompletionLookupWorker(const Config &config)
    : config_(config) {
  static std::once_flag curl_init_flag;
  std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

const std::string &ChatCompletionLookupWorker::defaultSystemPrompt() {
  static const std::string prompt =
      "You are an expert in analysing relationships between institutions. "
      "Analyse the relationship between target institution A and risk "
      "institution B.\n\n"
      "Return JSON in the following format:\n"
      "[\n"
      "  {\n"
      "    \"relationship_type\": \"Direct/Indirect/Significant Mention/No "
      "Evidence Found\",\n"
      "    \"finding_summary\": \"Relationship analysis and evidence\",\n"
      "    \"intermediaries\": [\"Organisations linking A and B\"],\n"
      "    \"sources\": [\"URLs supporting the finding\"]\n"
      "  }\n"
      "]\n\n"
      "Direct: partners, subsidiaries, funding and similar.\n"
      "Indirect: connections through third parties.\n"
      "Significant Mention: notable mention, relationship unclear.\n"
      "No Evidence Found: no relationship evidence found.\n";
  return prompt;
}

types::WorkResult
ChatCompletionLookupWorker::investigate(const std::string &target,
                                        const std::string &item) {
  const std::string user_prompt = "Please analyze the relationship between " +
                                  stripPromptCharacters(target) + " and " +
                                  stripPromptCharacters(item) +
                                  ".\nReturn the result in the required JSON "
                                  "format.";

  nlohmann::json messages = nlohmann::json::array();
  messages.push_back({{"role", "system"},
                      {"content", config_.system_prompt.empty()
                                      ? defaultSystemPrompt()
                                      : config_.system_prompt}});
  messages.push_back({{"role", "user"}, {"content", user_prompt}});

  nlohmann::json payload = {{"model", config_.model},
                            {"messages", messages},
                            {"stream", false},
                            {"temperature", config_.temperature}};
  const std::string body = payload.dump();

  CURL *curl = curl_easy_init();
  if (!curl) {
    throw TransportException(
        std::make_error_code(std::errc::resource_unavailable_try_again));
  }

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, "Accept: application/json");
  if (!config_.api_key.empty()) {
    std::string auth_header = "Authorization: Bearer " + config_.api_key;
    headers = curl_slist_append(headers, auth_header.c_str());
  }

  std::string response_data;

  curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint_url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(config_.connect_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(config_.request_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw TimeoutException("Chat completion request timed out");
  }
  if (res != CURLE_OK) {
    throw TransportException(std::string("Chat completion request failed: ") +
                             curl_easy_strerror(res));
  }
  if (http_code < 200 || http_code >= 300) {
    throw TransportException("Chat completion request returned HTTP " +
                                 std::to_string(http_code),
                             {{"status", http_code}});
  }

  nlohmann::json reply = json_utils::parse(response_data);
  try {
    const auto content = reply.at("choices")
                             .at(0)
                             .at("message")
                             .at("content")
                             .get<std::string>();
    DEEPSEARCH_LOG_TRACE("Chat completion reply for " + item + ": " + content);
    return parseReply(content, item);
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolException("Unexpected chat completion reply: " +
                            std::string(e.what()));
  }
}

types::WorkResult
ChatCompletionLookupWorker::parseReply(const std::string &content,
                                       const std::string &item) {
  nlohmann::json parsed;

  auto json_start = content.find('[');
  auto json_end = content.rfind(']');
  try {
    if (json_start != std::string::npos && json_end != std::string::npos &&
        json_end > json_start) {
      parsed = nlohmann::json::parse(
          content.substr(json_start, json_end - json_start + 1));
    } else {
      parsed = nlohmann::json::parse(content);
    }
  } catch (const nlohmann::json::parse_error &e) {
    throw ProtocolException("Chat reply holds no JSON result: " +
                            std::string(e.what()));
  }

  if (parsed.is_array()) {
    if (parsed.empty()) {
      throw ProtocolException("Chat reply holds an empty result list");
    }
    parsed = parsed.front();
  }
  if (!parsed.is_object()) {
    throw ProtocolException("Chat reply result is not an object");
  }

  types::WorkResult result;
  result.item_id = item;
  result.relationship_type =
      parsed.value("relationship_type", types::RelationshipType::Unknown);
  if (parsed.contains("finding_summary") &&
      parsed["finding_summary"].is_string()) {
    result.summary = parsed["finding_summary"].get<std::string>();
  } else if (parsed.contains("summary") && parsed["summary"].is_string()) {
    result.summary = parsed["summary"].get<std::string>();
  }

  if (parsed.contains("intermediaries") &&
      parsed["intermediaries"].is_array()) {
    for (const auto &entry : parsed["intermediaries"]) {
      if (entry.is_string() && !entry.get<std::string>().empty()) {
        result.intermediaries.push_back(entry.get<std::string>());
      }
    }
  } else {
    for (const auto &[key, value] : parsed.items()) {
      if (key.rfind("potential_intermediary_", 0) == 0 && value.is_string() &&
          !value.get<std::string>().empty()) {
        result.intermediaries.push_back(value.get<std::string>());
      }
    }
  }

  if (parsed.contains("sources")) {
    result.sources = readSources(parsed["sources"]);
  }

  return result;
}

} // namespace server
} // namespace deepsearch
