#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vault::util {

static constexpr std::string_view kBase64UrlChars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

namespace detail {

inline std::string encode_with(std::string_view input, std::string_view alphabet) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    uint32_t accumulator = 0;
    int bits_collected = 0;

    for (unsigned char c : input) {
        accumulator = (accumulator << 8) | c;
        bits_collected += 8;
        while (bits_collected >= 6) {
            bits_collected -= 6;
            output.push_back(alphabet[(accumulator >> bits_collected) & 0x3F]);
        }
    }

    if (bits_collected > 0) {
        accumulator <<= 6 - bits_collected;
        output.push_back(alphabet[accumulator & 0x3F]);
    }
    return output;
}

inline std::string decode_with(std::string_view input, std::string_view alphabet) {
    std::array<int, 256> decoding_table{};
    decoding_table.fill(-1);
    for (size_t i = 0; i < alphabet.size(); ++i) {
        decoding_table[static_cast<unsigned char>(alphabet[i])] = static_cast<int>(i);
    }

    std::string output;
    output.reserve((input.size() / 4) * 3 + 3);

    uint32_t accumulator = 0;
    int bits_collected = 0;

    for (char ch : input) {
        if (ch == '=') {
            break;
        }
        const int value = decoding_table[static_cast<unsigned char>(ch)];
        if (value < 0) {
            throw std::invalid_argument("Invalid Base64 character");
        }
        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits_collected += 6;
        if (bits_collected >= 8) {
            bits_collected -= 8;
            output.push_back(static_cast<char>((accumulator >> bits_collected) & 0xFF));
        }
    }
    return output;
}

}  // namespace detail

// Unpadded URL-safe alphabet (RFC 4648 section 5), as used by JWS compact serialization.
inline std::string base64url_encode(std::string_view input) {
    return detail::encode_with(input, kBase64UrlChars);
}

inline std::string base64url_decode(std::string_view input) {
    if (input.size() % 4 == 1) {
        throw std::invalid_argument("Invalid Base64url input length");
    }
    return detail::decode_with(input, kBase64UrlChars);
}

inline std::string hex_encode(std::string_view bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char byte : bytes) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

}  // namespace vault::util
