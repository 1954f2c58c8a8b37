#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

namespace call_relay {

/**
 * @brief String and encoding utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase (modified in place)
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

/**
 * @brief Case-insensitive substring test ("loopback" matches "BlackHole Loopback 2ch")
 */
inline bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return normalize_copy(haystack).find(normalize_copy(needle)) != std::string::npos;
}

/**
 * @brief Shorten text for log lines
 */
inline std::string preview(const std::string& text, size_t max_chars = 60) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "...";
}

namespace detail {
constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline int base64_index(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
} // namespace detail

/**
 * @brief Standard (RFC 4648) base64 with '=' padding
 */
inline std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out.push_back(detail::kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(detail::kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(detail::kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back(detail::kBase64Alphabet[n & 0x3F]);
    }
    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(detail::kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(detail::kBase64Alphabet[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(detail::kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(detail::kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(detail::kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

inline std::string base64_encode(const ByteBuffer& bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

/**
 * @brief Strict base64 decode
 *
 * Whitespace is skipped. Any other character outside the alphabet, a bad
 * length or misplaced padding is a ProtocolError.
 */
inline Result<ByteBuffer> base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (unsigned char c : text) {
        if (!std::isspace(c)) clean.push_back(static_cast<char>(c));
    }
    if (clean.size() % 4 != 0) {
        return make_protocol_error("base64 length " + std::to_string(clean.size()) + " is not a multiple of 4");
    }

    ByteBuffer out;
    out.reserve((clean.size() / 4) * 3);
    for (size_t i = 0; i < clean.size(); i += 4) {
        bool last_quad = (i + 4 == clean.size());
        int vals[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            char c = clean[i + k];
            if (c == '=') {
                // Padding only in the last two positions of the final quad
                if (!last_quad || k < 2) {
                    return make_protocol_error("unexpected base64 padding");
                }
                vals[k] = 0;
                ++padding;
            } else {
                if (padding > 0) {
                    return make_protocol_error("base64 data after padding");
                }
                vals[k] = detail::base64_index(static_cast<unsigned char>(c));
                if (vals[k] < 0) {
                    return make_protocol_error(std::string("invalid base64 character '") + c + "'");
                }
            }
        }
        uint32_t n = (static_cast<uint32_t>(vals[0]) << 18) |
                     (static_cast<uint32_t>(vals[1]) << 12) |
                     (static_cast<uint32_t>(vals[2]) << 6) |
                     static_cast<uint32_t>(vals[3]);
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

} // namespace utils

} // namespace call_relay
