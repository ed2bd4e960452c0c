#ifndef DEEPSEARCH_UTILS_ERROR_HPP_
#define DEEPSEARCH_UTILS_ERROR_HPP_

#include "deepsearch/types.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace deepsearch {

/**
 * @brief Base exception class for deepsearch errors
 *
 * This class extends std::runtime_error and carries structured error data
 * that can be sent over the wire unchanged.
 */
class DeepSearchException : public std::runtime_error {
public:
  /**
   * @brief Construct a new DeepSearchException with error data
   *
   * @param error The error data
   */
  explicit DeepSearchException(types::ErrorData error);

  /**
   * @brief Construct a new DeepSearchException with error code and message
   *
   * @param code The error code
   * @param message The error message
   */
  explicit DeepSearchException(types::ErrorCode code,
                               const std::string &message);

  /**
   * @brief Get the error data
   *
   * @return const types::ErrorData& The error data
   */
  const types::ErrorData &error() const;

protected:
  types::ErrorData &error_data();

private:
  types::ErrorData error_; ///< The error data
};

/**
 * @brief Exception for network and HTTP errors
 */
class TransportException : public DeepSearchException {
public:
  explicit TransportException(const std::string &message,
                              const nlohmann::json &data = nullptr);

  explicit TransportException(types::ErrorCode code, const std::string &message,
                              const nlohmann::json &data = nullptr);

  /**
   * @brief Construct a new TransportException from a std::error_code
   *
   * @param error The std::error_code
   */
  explicit TransportException(const std::error_code &error);
};

/**
 * @brief Exception for malformed requests, responses and stream events
 */
class ProtocolException : public DeepSearchException {
public:
  explicit ProtocolException(const std::string &message,
                             const nlohmann::json &data = nullptr);

  explicit ProtocolException(types::ErrorCode code, const std::string &message,
                             const nlohmann::json &data = nullptr);
};

/**
 * @brief Exception for timeout errors
 */
class TimeoutException : public DeepSearchException {
public:
  explicit TimeoutException(const std::string &message,
                            const nlohmann::json &data = nullptr);
};

/**
 * @brief Raised when a session id is unknown or has expired
 *
 * Resuming such a session is impossible; the caller must start over.
 */
class SessionNotFoundException : public DeepSearchException {
public:
  explicit SessionNotFoundException(const std::string &session_id);

  const std::string &sessionId() const;

private:
  std::string session_id_;
};

/**
 * @brief Build a stream error event from an exception
 *
 * @param exception The exception
 * @param fatal Whether the event terminates the stream
 * @return types::ErrorEvent The event
 */
types::ErrorEvent toErrorEvent(const DeepSearchException &exception,
                               bool fatal);

/**
 * @brief Build an HTTP error body of the form {"error": {...}}
 *
 * @param code The error code
 * @param message The error message
 * @param data Optional additional data
 * @return nlohmann::json The body
 */
nlohmann::json errorBody(types::ErrorCode code, const std::string &message,
                         const nlohmann::json &data = nullptr);

} // namespace deepsearch

#endif // DEEPSEARCH_UTILS_ERROR_HPP_
