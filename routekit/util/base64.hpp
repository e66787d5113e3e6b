#ifndef ROUTEKIT_UTIL_BASE64_HPP
#define ROUTEKIT_UTIL_BASE64_HPP

#include <string>
#include <string_view>
#include <stdexcept>
#include <cstdint>

namespace routekit {
namespace util {
namespace base64 {

namespace detail {

constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace detail

inline std::string encode(std::string_view input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(input[i]) << 16) |
                     (static_cast<uint8_t>(input[i + 1]) << 8) |
                     static_cast<uint8_t>(input[i + 2]);
        out += detail::alphabet[(n >> 18) & 0x3F];
        out += detail::alphabet[(n >> 12) & 0x3F];
        out += detail::alphabet[(n >> 6) & 0x3F];
        out += detail::alphabet[n & 0x3F];
    }

    if (i < input.size()) {
        uint32_t n = static_cast<uint8_t>(input[i]) << 16;
        if (i + 1 < input.size()) n |= static_cast<uint8_t>(input[i + 1]) << 8;
        out += detail::alphabet[(n >> 18) & 0x3F];
        out += detail::alphabet[(n >> 12) & 0x3F];
        out += (i + 1 < input.size()) ? detail::alphabet[(n >> 6) & 0x3F] : '=';
        out += '=';
    }

    return out;
}

// Throws std::invalid_argument on malformed input
inline std::string decode(std::string_view input) {
    if (input.size() % 4 != 0) {
        throw std::invalid_argument("base64: input length is not a multiple of 4");
    }

    std::string out;
    out.reserve((input.size() / 4) * 3);

    for (size_t i = 0; i < input.size(); i += 4) {
        int values[4];
        int padding = 0;
        for (int j = 0; j < 4; ++j) {
            char c = input[i + j];
            if (c == '=') {
                // padding is only allowed in the last two positions of the last block
                if (i + 4 != input.size() || j < 2) {
                    throw std::invalid_argument("base64: unexpected padding");
                }
                values[j] = 0;
                ++padding;
            } else {
                if (padding) throw std::invalid_argument("base64: data after padding");
                values[j] = detail::decode_char(c);
                if (values[j] < 0) throw std::invalid_argument("base64: invalid character");
            }
        }

        uint32_t n = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
        out += static_cast<char>((n >> 16) & 0xFF);
        if (padding < 2) out += static_cast<char>((n >> 8) & 0xFF);
        if (padding < 1) out += static_cast<char>(n & 0xFF);
    }

    return out;
}

} // namespace base64
} // namespace util
} // namespace routekit

#endif // ROUTEKIT_UTIL_BASE64_HPP
