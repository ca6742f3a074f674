// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>

namespace custos {

static constexpr std::string_view kHexDigits{"0123456789abcdef"};

static int hex_value(char digit) {
    if (digit >= '0' && digit <= '9') return digit - '0';
    if (digit >= 'a' && digit <= 'f') return digit - 'a' + 10;
    if (digit >= 'A' && digit <= 'F') return digit - 'A' + 10;
    return -1;
}

static char lower_ascii(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

std::string to_hex(ByteView bytes, bool with_prefix) {
    std::string hex;
    hex.reserve(2 * bytes.size() + 2);
    if (with_prefix) {
        hex += "0x";
    }
    for (const uint8_t byte : bytes) {
        hex += kHexDigits[byte >> 4];
        hex += kHexDigits[byte & 0xf];
    }
    return hex;
}

std::optional<Bytes> from_hex(std::string_view hex) {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }

    Bytes out;
    out.reserve((hex.size() + 1) / 2);
    // With an odd count the first digit stands alone as the low nibble of the first byte
    int high{hex.size() % 2 == 1 ? 0 : -1};
    for (const char digit : hex) {
        const int value{hex_value(digit)};
        if (value < 0) {
            return std::nullopt;
        }
        if (high < 0) {
            high = value;
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | value));
            high = -1;
        }
    }
    return out;
}

ByteView zeroless_view(ByteView bytes) {
    const auto first_non_zero{std::ranges::find_if(bytes, [](uint8_t b) { return b != 0; })};
    return bytes.substr(static_cast<size_t>(first_non_zero - bytes.begin()));
}

std::string abridge(std::string_view input, size_t length) {
    std::string out{input.substr(0, length)};
    if (input.size() > length) {
        out += "...";
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) { return lower_ascii(x) == lower_ascii(y); });
}

}  // namespace custos
