#ifndef DEEPSEARCH_SERVER_LOOKUP_WORKER_HPP_
#define DEEPSEARCH_SERVER_LOOKUP_WORKER_HPP_

#include <chrono>
#include <string>

#include "deepsearch/types.hpp"

namespace deepsearch {
namespace server {

/**
 * @brief Investigates the relationship between a target and one item
 *
 * Implementations may block for a long time and may throw; the batch
 * dispatcher enforces a timeout and turns failures into Unknown results.
 * investigate() is called concurrently from several threads.
 */
class LookupWorker {
public:
  virtual ~LookupWorker() = default;

  /**
   * @brief Investigate one item
   *
   * @param target The target under investigation
   * @param item The reference item
   * @return types::WorkResult The result, with item_id set to item
   */
  virtual types::WorkResult investigate(const std::string &target,
                                        const std::string &item) = 0;
};

/**
 * @brief Lookup worker producing deterministic local results
 *
 * The same (target, item) pair always yields the same relationship, weighted
 * towards No Evidence Found.
 */
class SimulatedLookupWorker : public LookupWorker {
public:
  struct Config {
    /**
     * @brief Time each lookup takes
     */
    std::chrono::milliseconds latency = std::chrono::milliseconds(500);

    /**
     * @brief Fraction of (target, item) pairs whose lookup throws
     */
    double failure_rate = 0.0;
  };

  explicit SimulatedLookupWorker() : SimulatedLookupWorker(Config()) {}
  explicit SimulatedLookupWorker(const Config &config);

  types::WorkResult investigate(const std::string &target,
                                const std::string &item) override;

private:
  Config config_;
};

/**
 * @brief Lookup worker backed by an OpenAI-compatible chat completion API
 */
class ChatCompletionLookupWorker : public LookupWorker {
public:
  struct Config {
    std::string endpoint_url = "https://openrouter.ai/api/v1/chat/completions";
    std::string api_key;
    std::string model = "google/gemini-2.5-pro-preview";

    /**
     * @brief System prompt; a built-in prompt is used when empty
     */
    std::string system_prompt;

    std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);
    std::chrono::milliseconds request_timeout = std::chrono::seconds(110);
    double temperature = 0.1;
  };

  explicit ChatCompletionLookupWorker(const Config &config);

  /**
   * @brief POST the prompts and parse the reply
   *
   * @throws TransportException on network or HTTP errors
   * @throws ProtocolException if the reply holds no usable result
   */
  types::WorkResult investigate(const std::string &target,
                                const std::string &item) override;

  /**
   * @brief Extract a result from the assistant message content
   *
   * The content is expected to hold a JSON array whose first object carries
   * relationship_type, finding_summary, intermediaries (or
   * potential_intermediary_* keys) and sources.
   *
   * @param content The assistant message content
   * @param item The item the result belongs to
   * @return types::WorkResult The result
   * @throws ProtocolException if no JSON result can be found
   */
  static types::WorkResult parseReply(const std::string &content,
                                      const std::string &item);

  static const std::string &defaultSystemPrompt();

private:
  Config config_;
};

} // namespace server
} // namespace deepsearch

#endif // DEEPSEARCH_SERVER_LOOKUP_WORKER_HPP_
