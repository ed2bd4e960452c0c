#ifndef DEEPSEARCH_CLIENT_SSE_PARSER_HPP_
#define DEEPSEARCH_CLIENT_SSE_PARSER_HPP_

#include <string>
#include <vector>

namespace deepsearch {
namespace client {

/**
 * @brief Incremental parser for a text/event-stream body
 *
 * Chunks may split events anywhere. Only "message" events (the default type)
 * are returned; comment lines and other fields are ignored.
 */
class SseEventParser {
public:
  /**
   * @brief Feed a chunk of the stream
   *
   * @param chunk Bytes received
   * @return std::vector<std::string> Data payloads of the events completed by
   * this chunk, in order
   */
  std::vector<std::string> feed(const std::string &chunk);

  /**
   * @brief Drop any partially received event
   */
  void reset();

  /**
   * @brief Number of buffered bytes not yet forming a complete event
   */
  std::size_t buffered() const;

private:
  std::string buffer_;
};

} // namespace client
} // namespace deepsearch

#endif // DEEPSEARCH_CLIENT_SSE_PARSER_HPP_
