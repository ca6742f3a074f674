// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <algorithm>
#include <cstring>

#include <custos/core/common/base.hpp>
#include <custos/core/common/util.hpp>

namespace custos {

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data(), n);
    }
    return out;
}

evmc::bytes32 to_bytes32(const intx::uint256& value) noexcept {
    evmc::bytes32 out;
    intx::be::store(out.bytes, value);
    return out;
}

intx::uint256 to_uint256(const evmc::bytes32& value) noexcept {
    return intx::be::load<intx::uint256>(value.bytes);
}

std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex) {
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes || bytes->size() != kHashLength) {
        return std::nullopt;
    }
    return to_bytes32(*bytes);
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return custos::to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace custos
