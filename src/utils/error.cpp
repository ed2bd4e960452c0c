#include "deepsearch/utils/error.hpp"

namespace deepsearch {

DeepSearchException::DeepSearchException(types::ErrorData error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

DeepSearchException::DeepSearchException(types::ErrorCode code,
                                         const std::string &message)
    : std::runtime_error(message),
      error_({static_cast<int>(code), message, nullptr}) {}

const types::ErrorData &DeepSearchException::error() const { return error_; }

types::ErrorData &DeepSearchException::error_data() { return error_; }

TransportException::TransportException(const std::string &message,
                                       const nlohmann::json &data)
    : DeepSearchException(types::ErrorCode::TransportError, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

TransportException::TransportException(types::ErrorCode code,
                                       const std::string &message,
                                       const nlohmann::json &data)
    : DeepSearchException(code, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

TransportException::TransportException(const std::error_code &error)
    : DeepSearchException(types::ErrorCode::TransportError, error.message()) {
  error_data().data = {{"category", error.category().name()},
                       {"value", error.value()}};
}

ProtocolException::ProtocolException(const std::string &message,
                                     const nlohmann::json &data)
    : DeepSearchException(types::ErrorCode::ProtocolError, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

ProtocolException::ProtocolException(types::ErrorCode code,
                                     const std::string &message,
                                     const nlohmann::json &data)
    : DeepSearchException(code, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

TimeoutException::TimeoutException(const std::string &message,
                                   const nlohmann::json &data)
    : DeepSearchException(types::ErrorCode::TimeoutError, message) {
  if (!data.is_null()) {
    error_data().data = data;
  }
}

SessionNotFoundException::SessionNotFoundException(
    const std::string &session_id)
    : DeepSearchException(types::ErrorCode::SessionNotFound,
                          "Session not found: " + session_id),
      session_id_(session_id) {
  error_data().data = {{"sessionId", session_id}};
}

const std::string &SessionNotFoundException::sessionId() const {
  return session_id_;
}

types::ErrorEvent toErrorEvent(const DeepSearchException &exception,
                               bool fatal) {
  return {.message = exception.error().message,
          .fatal = fatal,
          .code = exception.error().code};
}

nlohmann::json errorBody(types::ErrorCode code, const std::string &message,
                         const nlohmann::json &data) {
  types::ErrorData error{.code = static_cast<int>(code),
                         .message = message,
                         .data = data};
  return nlohmann::json{{"error", error}};
}

} // namespace deepsearch
