#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <limits>
#include <cmath>

namespace lcfeat {

/// Mass-to-charge ratio type
using MZ = double;

/// Intensity value type
using Intensity = double;

/// Retention time in minutes
using RetentionTime = double;

/// Index type for scans, ROIs and features
using Index = std::size_t;

/// Sample identifier (position of the sample in the run)
using SampleId = std::uint32_t;

/// MS level (1 = MS1, 2 = MS/MS, etc.)
using MSLevel = std::uint8_t;

/// Charge state
using ChargeState = std::int8_t;

/// Mass difference between the 13C and 12C isotopes
constexpr double C13_MASS_DIFFERENCE = 1.003355;

/// Proton mass
constexpr double PROTON_MASS = 1.007276;

/// Polarity of the ion mode
enum class Polarity : std::int8_t {
    UNKNOWN = 0,
    POSITIVE = 1,
    NEGATIVE = -1
};

/// Outcome of processing one sample
enum class Status : std::uint8_t {
    OK = 0,
    ERROR,
    MALFORMED_SCAN,
    CANCELLED,
    NOT_RUN
};

/// Range template for min/max values
template<typename T>
struct Range {
    T min_value = std::numeric_limits<T>::max();
    T max_value = std::numeric_limits<T>::lowest();

    Range() = default;
    Range(T min_val, T max_val) : min_value(min_val), max_value(max_val) {}

    void extend(T value) {
        if (value < min_value) min_value = value;
        if (value > max_value) max_value = value;
    }
};

using RTRange = Range<RetentionTime>;

/// Key-value metadata container
using MetaData = std::map<std::string, std::string>;

/// Convert polarity to string
inline std::string toString(Polarity p) {
    switch (p) {
        case Polarity::POSITIVE: return "positive";
        case Polarity::NEGATIVE: return "negative";
        default: return "unknown";
    }
}

/// Convert status to string
inline std::string toString(Status s) {
    switch (s) {
        case Status::OK: return "ok";
        case Status::MALFORMED_SCAN: return "malformed scan";
        case Status::CANCELLED: return "cancelled";
        case Status::NOT_RUN: return "not run";
        default: return "error";
    }
}

} // namespace lcfeat
