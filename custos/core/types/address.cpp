// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <custos/core/common/base.hpp>
#include <custos/core/common/util.hpp>

namespace custos {

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes || bytes->size() != kAddressLength) {
        return std::nullopt;
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

bool address_matches(std::string_view hex, const evmc::address& address) {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    return iequals(hex, to_hex(ByteView{address.bytes}));
}

std::optional<evmc::address> public_key_to_address(ByteView public_key) noexcept {
    if (public_key.size() == kUncompressedPublicKeyLength) {
        if (public_key[0] != 0x04) {
            return std::nullopt;
        }
        // Ignore first byte of public key
        public_key.remove_prefix(1);
    }
    if (public_key.size() != kUncompressedPublicKeyLength - 1) {
        return std::nullopt;
    }
    const ethash::hash256 key_hash{keccak256(public_key)};
    evmc::address address{};
    std::memcpy(address.bytes, &key_hash.bytes[kHashLength - kAddressLength], kAddressLength);
    return address;
}

}  // namespace custos

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << custos::address_to_hex(address);
}

}  // namespace evmc
