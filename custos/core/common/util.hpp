// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>

#include <custos/core/common/bytes.hpp>

namespace custos {

inline bool has_hex_prefix(std::string_view hex) {
    return hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
}

//! Lowercase hex digits of bytes, "0x" prefixed on request
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Parses hex digits, with or without a 0x prefix
//! \return std::nullopt on any non hex digit; an odd digit count reads as if a leading 0 was present
std::optional<Bytes> from_hex(std::string_view hex);

//! Same bytes without leading zeros
ByteView zeroless_view(ByteView bytes);

//! input cut to length characters, with "..." appended when something was cut
std::string abridge(std::string_view input, size_t length);

//! ASCII case-insensitive equality
bool iequals(std::string_view a, std::string_view b);

inline ethash::hash256 keccak256(ByteView data) { return ethash::keccak256(data.data(), data.size()); }

}  // namespace custos
