#ifndef DEEPSEARCH_UTILS_LOGGING_HPP_
#define DEEPSEARCH_UTILS_LOGGING_HPP_

#include <functional>
#include <string>

namespace deepsearch {
namespace logging {

/**
 * @brief Log levels
 */
enum class Level { Trace, Debug, Info, Warning, Error, Fatal };

/**
 * @brief Convert a log level to a string
 *
 * @param level The log level
 * @return std::string The string representation
 */
std::string levelToString(Level level);

/**
 * @brief Parse a log level from a string (case-insensitive)
 *
 * @param level_str The string representation
 * @return Level The log level
 * @throws std::invalid_argument if the string is not a valid log level
 */
Level levelFromString(const std::string &level_str);

/**
 * @brief Log handler function type
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
using LogHandler = std::function<void(Level level, const std::string &message,
                                      const std::string &file, int line)>;

void setLevel(Level level);

Level getLevel();

/**
 * @brief Set the global log handler
 *
 * Passing an empty handler restores the default one.
 *
 * @param handler The log handler
 */
void setHandler(LogHandler handler);

/**
 * @brief Log a message
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
void log(Level level, const std::string &message, const std::string &file = "",
         int line = 0);

bool isEnabled(Level level);

/**
 * @brief Default log handler that logs to stderr
 *
 * Format: [LEVEL] [time] [thread] [file:line] message
 */
void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line);

} // namespace logging
} // namespace deepsearch

// Convenience macros for logging
#define DEEPSEARCH_LOG_TRACE(msg)                                              \
  do {                                                                         \
    if (deepsearch::logging::isEnabled(deepsearch::logging::Level::Trace)) {   \
      deepsearch::logging::log(deepsearch::logging::Level::Trace, msg,         \
                               __FILE__, __LINE__);                            \
    }                                                                          \
  } while (0)

#define DEEPSEARCH_LOG_DEBUG(msg)                                              \
  do {                                                                         \
    if (deepsearch::logging::isEnabled(deepsearch::logging::Level::Debug)) {   \
      deepsearch::logging::log(deepsearch::logging::Level::Debug, msg,         \
                               __FILE__, __LINE__);                            \
    }                                                                          \
  } while (0)

#define DEEPSEARCH_LOG_INFO(msg)                                               \
  do {                                                                         \
    if (deepsearch::logging::isEnabled(deepsearch::logging::Level::Info)) {    \
      deepsearch::logging::log(deepsearch::logging::Level::Info, msg,          \
                               __FILE__, __LINE__);                            \
    }                                                                          \
  } while (0)

#define DEEPSEARCH_LOG_WARNING(msg)                                            \
  do {                                                                         \
    if (deepsearch::logging::isEnabled(deepsearch::logging::Level::Warning)) { \
      deepsearch::logging::log(deepsearch::logging::Level::Warning, msg,       \
                               __FILE__, __LINE__);                            \
    }                                                                          \
  } while (0)

#define DEEPSEARCH_LOG_ERROR(msg)                                              \
  do {                                                                         \
    if (deepsearch::logging::isEnabled(deepsearch::logging::Level::Error)) {   \
      deepsearch::logging::log(deepsearch::logging::Level::Error, msg,         \
                               __FILE__, __LINE__);                            \
    }                                                                          \
  } while (0)

#define DEEPSEARCH_LOG_FATAL(msg)                                              \
  do {                                                                         \
    if (deepsearch::logging::isEnabled(deepsearch::logging::Level::Fatal)) {   \
      deepsearch::logging::log(deepsearch::logging::Level::Fatal, msg,         \
                               __FILE__, __LINE__);                            \
    }                                                                          \
  } while (0)

#endif // DEEPSEARCH_UTILS_LOGGING_HPP_
