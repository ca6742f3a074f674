// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "digest.hpp"

#include <cstring>
#include <string>

#include <custos/core/common/base.hpp>
#include <custos/core/common/bytes_to_string.hpp>
#include <custos/core/common/util.hpp>

namespace custos {

static evmc::bytes32 to_digest(const ethash::hash256& hash) {
    evmc::bytes32 digest;
    std::memcpy(digest.bytes, hash.bytes, kHashLength);
    return digest;
}

evmc::bytes32 hash_message(ByteView message) {
    const std::string length{std::to_string(message.size())};
    Bytes preimage;
    preimage.reserve(kPersonalMessagePrefix.size() + length.size() + message.size());
    preimage.append(string_view_to_byte_view(kPersonalMessagePrefix));
    preimage.append(string_view_to_byte_view(length));
    preimage.append(message);
    return to_digest(keccak256(preimage));
}

evmc::bytes32 hash_typed_data(const evmc::bytes32& domain_separator, const evmc::bytes32& struct_hash) {
    uint8_t preimage[2 + 2 * kHashLength]{0x19, 0x01};
    std::memcpy(preimage + 2, domain_separator.bytes, kHashLength);
    std::memcpy(preimage + 2 + kHashLength, struct_hash.bytes, kHashLength);
    return to_digest(keccak256(ByteView{preimage}));
}

evmc::bytes32 hash_transaction(ByteView unsigned_payload) {
    return to_digest(keccak256(unsigned_payload));
}

}  // namespace custos
