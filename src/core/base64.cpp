#include "core/base64.h"

#include <cctype>

namespace spotty::core::base64 {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int sextet(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }
    return -1;
}

std::string encodeBytes(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve(((length + 2) / 3) * 4);

    uint32_t accumulator = 0;
    int bits = 0;
    for (size_t i = 0; i < length; ++i) {
        accumulator = (accumulator << 8) | data[i];
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            out.push_back(kAlphabet[(accumulator >> bits) & 0x3F]);
        }
    }
    if (bits > 0) {
        out.push_back(kAlphabet[(accumulator << (6 - bits)) & 0x3F]);
    }
    while (out.size() % 4 != 0) {
        out.push_back('=');
    }
    return out;
}

}  // namespace

std::string encode(const std::vector<uint8_t>& data) {
    return encodeBytes(data.data(), data.size());
}

std::string encode(std::string_view text) {
    return encodeBytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::optional<std::vector<uint8_t>> decode(std::string_view encoded) {
    std::vector<uint8_t> out;
    out.reserve((encoded.size() / 4) * 3);

    uint32_t accumulator = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (char c : encoded) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            // data after padding
            return std::nullopt;
        }
        int value = sextet(c);
        if (value < 0) {
            return std::nullopt;
        }
        ++symbols;
        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }

    if (padding > 2 || symbols % 4 == 1) {
        return std::nullopt;
    }
    if (padding > 0 && (symbols + padding) % 4 != 0) {
        return std::nullopt;
    }
    return out;
}

}  // namespace spotty::core::base64
