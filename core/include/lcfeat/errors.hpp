#pragma once

#include <stdexcept>
#include <string>

namespace lcfeat {

/**
 * @brief Exception thrown when a configuration value is out of range.
 *
 * Raised before any processing starts; a run never begins with an
 * invalid configuration.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error("configuration error: " + msg) {}
};

/**
 * @brief Exception thrown when a scan violates the scan source contract.
 *
 * Retention times must strictly increase and centroids must be sorted
 * by m/z. Only the offending sample fails.
 */
class MalformedScanError : public std::runtime_error {
public:
    MalformedScanError(const std::string& msg, std::size_t scan_index)
        : std::runtime_error("malformed scan " + std::to_string(scan_index) +
                             ": " + msg),
          scan_index_(scan_index) {}

    [[nodiscard]] std::size_t scanIndex() const noexcept { return scan_index_; }

private:
    std::size_t scan_index_;
};

/**
 * @brief Exception thrown when per-sample processing is cancelled.
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& msg)
        : std::runtime_error("cancelled: " + msg) {}
};

/**
 * @brief Exception thrown when a feature record cannot be decoded.
 */
class RecordError : public std::runtime_error {
public:
    explicit RecordError(const std::string& msg)
        : std::runtime_error("record error: " + msg) {}
};

} // namespace lcfeat
