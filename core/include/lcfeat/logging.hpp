#pragma once

#include <string>

namespace lcfeat {

/// Logging verbosity
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

/**
 * @brief Set the minimum severity of the library's log records.
 *
 * Records are written through the Boost.Log trivial logger; without a
 * call every record is emitted.
 */
void initLogging(LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error", "fatal").
 *
 * @throws ConfigError on an unknown name
 */
LogLevel parseLogLevel(const std::string& name);

} // namespace lcfeat
