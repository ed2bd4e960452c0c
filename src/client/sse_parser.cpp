#include "deepsearch/client/sse_parser.hpp"

#include <sstream>

namespace deepsearch {
namespace client {

std::vector<std::string> SseEventParser::feed(const std::string &chunk) {
  // Normalise CRLF line endings
  for (char c : chunk) {
    if (c != '\r') {
      buffer_ += c;
    }
  }

  std::vector<std::string> payloads;

  size_t pos = 0;
  while ((pos = buffer_.find("\n\n")) != std::string::npos) {
    std::string event = buffer_.substr(0, pos + 2);
    buffer_.erase(0, pos + 2);

    std::string event_type;
    std::string data;
    bool has_data = false;

    std::istringstream iss(event);
    std::string line;
    while (std::getline(iss, line)) {
      if (line.empty() || line[0] == ':') {
        continue;
      }

      if (line.compare(0, 6, "event:") == 0) {
        event_type = line.substr(6);
        event_type.erase(0, event_type.find_first_not_of(" \t"));
      } else if (line.compare(0, 5, "data:") == 0) {
        std::string value = line.substr(5);
        if (!value.empty() && value[0] == ' ') {
          value.erase(0, 1);
        }
        if (has_data) {
          data += "\n";
        }
        data += value;
        has_data = true;
      }
    }

    if (has_data && (event_type.empty() || event_type == "message")) {
      payloads.push_back(std::move(data));
    }
  }

  return payloads;
}

void SseEventParser::reset() { buffer_.clear(); }

std::size_t SseEventParser::buffered() const { return buffer_.size(); }

} // namespace client
} // namespace deepsearch
