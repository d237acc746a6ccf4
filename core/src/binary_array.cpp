#include "lcfeat/io/binary_array.hpp"
#include "lcfeat/errors.hpp"

#include <algorithm>
#include <cstring>

#include <zlib.h>

namespace lcfeat {
namespace io {

namespace {

bool systemIsLittleEndian() {
    const std::uint16_t probe = 1;
    std::uint8_t first = 0;
    std::memcpy(&first, &probe, 1);
    return first == 1;
}

void swapEndian(std::uint8_t* bytes, std::size_t element_size, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
        std::reverse(bytes + i * element_size, bytes + (i + 1) * element_size);
    }
}

} // namespace

const char Base64::encoding_table_[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// -1 = invalid, -2 = whitespace/padding
const int Base64::decoding_table_[] = {
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-2,-2,-1,-1,-2,-1,-1,  // 0-15
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,  // 16-31
    -2,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,62,-1,-1,-1,63,  // 32-47 (space, +, /)
    52,53,54,55,56,57,58,59,60,61,-1,-1,-1,-2,-1,-1,  // 48-63 (0-9, =)
    -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,  // 64-79 (A-O)
    15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,-1,  // 80-95 (P-Z)
    -1,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,  // 96-111 (a-o)
    41,42,43,44,45,46,47,48,49,50,51,-1,-1,-1,-1,-1,  // 112-127 (p-z)
};

std::vector<std::uint8_t> Base64::decode(const std::string& input) {
    std::vector<std::uint8_t> output;
    output.reserve((input.size() * 3) / 4);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        auto uc = static_cast<unsigned char>(c);
        int value = uc < 128 ? decoding_table_[uc] : -1;
        if (value == -1) {
            throw RecordError("invalid Base64 character");
        }
        if (value == -2) continue;

        buffer = (buffer << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return output;
}

std::string Base64::encode(const std::vector<std::uint8_t>& data) {
    return encode(data.data(), data.size());
}

std::string Base64::encode(const std::uint8_t* data, std::size_t length) {
    std::string output;
    output.reserve(4 * ((length + 2) / 3));

    for (std::size_t i = 0; i < length; i += 3) {
        const std::size_t remaining = std::min<std::size_t>(3, length - i);
        std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        if (remaining > 1) n |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        if (remaining > 2) n |= static_cast<std::uint32_t>(data[i + 2]);

        output += encoding_table_[(n >> 18) & 0x3F];
        output += encoding_table_[(n >> 12) & 0x3F];
        output += remaining > 1 ? encoding_table_[(n >> 6) & 0x3F] : '=';
        output += remaining > 2 ? encoding_table_[n & 0x3F] : '=';
    }
    return output;
}

bool Base64::isValid(const std::string& input) {
    return std::all_of(input.begin(), input.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc < 128 && decoding_table_[uc] != -1;
    });
}

std::vector<std::uint8_t> Zlib::decompress(const std::vector<std::uint8_t>& input) {
    if (input.empty()) {
        return {};
    }

    std::vector<std::uint8_t> output(input.size() * 4);

    z_stream stream{};
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    if (inflateInit(&stream) != Z_OK) {
        throw RecordError("failed to initialize zlib decompression");
    }

    int result;
    while ((result = inflate(&stream, Z_NO_FLUSH)) != Z_STREAM_END) {
        if (result == Z_OK && stream.avail_out == 0) {
            std::size_t produced = output.size();
            output.resize(output.size() * 2);
            stream.next_out = output.data() + produced;
            stream.avail_out = static_cast<uInt>(output.size() - produced);
        } else {
            inflateEnd(&stream);
            throw RecordError("zlib stream is corrupt or truncated");
        }
    }

    output.resize(output.size() - stream.avail_out);
    inflateEnd(&stream);
    return output;
}

std::vector<std::uint8_t> Zlib::compress(const std::vector<std::uint8_t>& input,
                                         int level) {
    uLongf size = compressBound(static_cast<uLong>(input.size()));
    std::vector<std::uint8_t> output(size);
    if (compress2(output.data(), &size, input.data(),
                  static_cast<uLong>(input.size()), level) != Z_OK) {
        throw RecordError("zlib compression failed");
    }
    output.resize(size);
    return output;
}

std::string encodeArray(const std::vector<double>& values) {
    std::vector<std::uint8_t> bytes(values.size() * sizeof(double));
    if (!bytes.empty()) {
        std::memcpy(bytes.data(), values.data(), bytes.size());
    }
    if (!systemIsLittleEndian()) {
        swapEndian(bytes.data(), sizeof(double), values.size());
    }
    return Base64::encode(Zlib::compress(bytes));
}

std::vector<double> decodeArray(const std::string& encoded) {
    auto bytes = Zlib::decompress(Base64::decode(encoded));
    if (bytes.size() % sizeof(double) != 0) {
        throw RecordError("binary array of " + std::to_string(bytes.size()) +
                          " bytes is not a float64 array");
    }

    const std::size_t count = bytes.size() / sizeof(double);
    if (!systemIsLittleEndian()) {
        swapEndian(bytes.data(), sizeof(double), count);
    }
    std::vector<double> values(count);
    if (count > 0) {
        std::memcpy(values.data(), bytes.data(), bytes.size());
    }
    return values;
}

} // namespace io
} // namespace lcfeat
