/*
 * file_codec.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "file_codec.hpp"

#include <array>
#include <cstdint>

namespace enclave::guest {

namespace {

constexpr std::string_view ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int8_t, 256> makeDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& entry : table) entry = -1;
    for (size_t i = 0; i < ALPHABET.size(); ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto DECODE_TABLE = makeDecodeTable();

}  // namespace

bool isValidUtf8(std::string_view data) noexcept {
    size_t i = 0;
    while (i < data.size()) {
        auto c = static_cast<unsigned char>(data[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t codepoint = 0;
        if ((c & 0xE0) == 0xC0) {
            length = 2;
            codepoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
            codepoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
            codepoint = c & 0x07;
        } else {
            return false;
        }

        if (i + length > data.size()) return false;
        for (size_t k = 1; k < length; ++k) {
            auto cc = static_cast<unsigned char>(data[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            codepoint = (codepoint << 6) | (cc & 0x3F);
        }

        if ((length == 2 && codepoint < 0x80) || (length == 3 && codepoint < 0x800) ||
            (length == 4 && codepoint < 0x10000) || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string base64Encode(std::string_view data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8) |
                     static_cast<unsigned char>(data[i + 2]);
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += ALPHABET[n & 0x3F];
        i += 3;
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<unsigned char>(data[i]) << 16;
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8);
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::expected<std::string, std::string> base64Decode(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size() / 4 * 3);

    uint32_t buffer = 0;
    int bits = 0;
    size_t padding = 0;

    for (char ch : encoded) {
        if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t') continue;
        if (ch == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::unexpected(std::string("data after base64 padding"));
        }
        auto value = DECODE_TABLE[static_cast<unsigned char>(ch)];
        if (value < 0) {
            return std::unexpected(std::string("invalid base64 character"));
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }

    if (padding > 2 || bits >= 6) {
        return std::unexpected(std::string("truncated base64 input"));
    }
    return out;
}

}  // namespace enclave::guest
