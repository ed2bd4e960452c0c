#include "deepsearch/client/stream_connection.hpp"

namespace deepsearch {
namespace client {

namespace {

class StreamErrorCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "stream"; }

  std::string message(int ev) const override {
    switch (static_cast<StreamError>(ev)) {
    case StreamError::ConnectFailed:
      return "Connection failed";
    case StreamError::HttpStatus:
      return "Unexpected HTTP status";
    case StreamError::Disconnected:
      return "Stream disconnected";
    case StreamError::Timeout:
      return "Stream timed out";
    default:
      return "Unknown error";
    }
  }
};

} // namespace

const std::error_category &stream_category() {
  static StreamErrorCategory category;
  return category;
}

std::error_code make_error_code(StreamError e) {
  return {static_cast<int>(e), stream_category()};
}

} // namespace client
} // namespace deepsearch
