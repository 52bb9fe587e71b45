#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <zlib.h>

namespace conduit::test {

// window_bits: 15 + 16 gzip, 15 zlib, -15 raw deflate
inline std::vector<uint8_t> compress(const std::string& input, int window_bits) {
    z_stream strm{};
    deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY);

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());

    std::vector<uint8_t> output;
    uint8_t buffer[4096];

    do {
        strm.next_out = buffer;
        strm.avail_out = sizeof(buffer);
        deflate(&strm, Z_FINISH);
        size_t have = sizeof(buffer) - strm.avail_out;
        output.insert(output.end(), buffer, buffer + have);
    } while (strm.avail_out == 0);

    deflateEnd(&strm);
    return output;
}

inline std::vector<uint8_t> compress_gzip(const std::string& input) {
    return compress(input, 15 + 16);
}

inline std::vector<uint8_t> compress_zlib(const std::string& input) {
    return compress(input, 15);
}

inline std::vector<uint8_t> compress_deflate(const std::string& input) {
    return compress(input, -15);
}

inline std::string as_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace conduit::test
