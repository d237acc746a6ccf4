#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lcfeat {
namespace io {

/**
 * @brief Base64 encoding/decoding of byte buffers.
 */
class Base64 {
public:
    /**
     * @brief Decode a Base64 string; whitespace and padding are skipped.
     *
     * @throws RecordError if input contains invalid characters
     */
    static std::vector<std::uint8_t> decode(const std::string& input);

    /// Encode bytes to a padded Base64 string
    static std::string encode(const std::vector<std::uint8_t>& data);
    static std::string encode(const std::uint8_t* data, std::size_t length);

    /// Check if a string contains only Base64 characters, whitespace and padding
    static bool isValid(const std::string& input);

private:
    static const char encoding_table_[];
    static const int decoding_table_[];
};

/**
 * @brief Zlib compression of byte buffers.
 */
class Zlib {
public:
    /**
     * @brief Decompress zlib data.
     *
     * @throws RecordError if the stream is corrupt or truncated
     */
    static std::vector<std::uint8_t> decompress(const std::vector<std::uint8_t>& input);

    /// Compress data (level 0-9)
    static std::vector<std::uint8_t> compress(const std::vector<std::uint8_t>& input,
                                              int level = 6);
};

/**
 * @brief Encode a float64 array as Base64 of zlib-compressed little-endian bytes.
 */
std::string encodeArray(const std::vector<double>& values);

/**
 * @brief Decode an array written by encodeArray().
 *
 * @throws RecordError if the data is not valid Base64, not a zlib stream,
 *         or not a whole number of float64 values
 */
std::vector<double> decodeArray(const std::string& encoded);

} // namespace io
} // namespace lcfeat
