#include "pch.h"

#include "Encoding/Base64.hpp"

namespace Encoders {

#pragma region Internal Function

static const char b64_table[] =
"ABCDEFGHIJKLMNOPQRSTUVWXYZ"
"abcdefghijklmnopqrstuvwxyz"
"0123456789+/";

static inline bool is_whitespace(char c) {
    return c == '\r' || c == '\n' || c == ' ' || c == '\t';
}

static inline bool is_b64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// validate base64 characters (after whitespace removal); '=' may only appear as trailing padding
static bool ValidateBase64(const std::string& s) {
    if (s.empty()) return false;

    size_t firstPad = s.find('=');
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '=') {
            if (i < s.size() - 2) return false;
            continue;
        }
        if (i > firstPad || !is_b64_char(c)) return false;
    }
    return true;
}
#pragma endregion

std::string Base64_Encode(const std::uint8_t* data, std::size_t size)
{
    if (data == nullptr || size == 0) return "";

    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < size) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | uint32_t(data[i + 2]);
        out.push_back(b64_table[(triple >> 18) & 0x3F]);
        out.push_back(b64_table[(triple >> 12) & 0x3F]);
        out.push_back(b64_table[(triple >> 6) & 0x3F]);
        out.push_back(b64_table[triple & 0x3F]);
        i += 3;
    }

    size_t rem = size - i;
    if (rem) {
        uint32_t triple = uint32_t(data[i]) << 16;
        if (rem == 2) triple |= uint32_t(data[i + 1]) << 8;

        out.push_back(b64_table[(triple >> 18) & 0x3F]);
        out.push_back(b64_table[(triple >> 12) & 0x3F]);
        out.push_back(rem == 2 ? b64_table[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }

    return out;
}

std::string Base64_Encode(const std::vector<std::uint8_t>& data)
{
    return Base64_Encode(data.data(), data.size());
}

std::vector<std::uint8_t> Base64_Decode(const std::string& input)
{
    if (input.empty()) return {};

    // Remove whitespace characters first.
    std::string s;
    s.reserve(input.size());
    for (char c : input) {
        if (!is_whitespace(c)) s.push_back(c);
    }
    if (s.empty()) return {};

    if (s.size() % 4 != 0) {
        ENCODERS_LOG_ERROR("Base64 decoding: invalid input length (not a multiple of 4).");
        return {};
    }
    if (!ValidateBase64(s)) {
        ENCODERS_LOG_ERROR("Base64 decoding: invalid characters in input.");
        return {};
    }

    // Build reverse lookup table
    int rev[256];
    for (int i = 0; i < 256; ++i) rev[i] = -1;
    for (int i = 0; i < 64; ++i) rev[static_cast<unsigned char>(b64_table[i])] = i;

    size_t padding = 0;
    if (s[s.size() - 1] == '=') ++padding;
    if (s[s.size() - 2] == '=') ++padding;

    std::vector<std::uint8_t> out;
    out.reserve((s.size() / 4) * 3 - padding);

    for (size_t i = 0; i < s.size(); i += 4)
    {
        int v0 = rev[static_cast<unsigned char>(s[i])];
        int v1 = rev[static_cast<unsigned char>(s[i + 1])];
        int v2 = (s[i + 2] == '=') ? 0 : rev[static_cast<unsigned char>(s[i + 2])];
        int v3 = (s[i + 3] == '=') ? 0 : rev[static_cast<unsigned char>(s[i + 3])];

        if (v0 < 0 || v1 < 0 || v2 < 0 || v3 < 0) {
            ENCODERS_LOG_ERROR("Base64 decoding: invalid character encountered.");
            return {};
        }

        uint32_t triple = (uint32_t(v0) << 18) | (uint32_t(v1) << 12) | (uint32_t(v2) << 6) | uint32_t(v3);

        out.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
        if (s[i + 2] != '=') out.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
        if (s[i + 3] != '=') out.push_back(static_cast<std::uint8_t>(triple & 0xFF));
    }

    return out;
}

}
