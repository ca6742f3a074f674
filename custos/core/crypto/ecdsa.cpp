// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <cstring>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <custos/core/common/base.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/y_parity_and_chain_id.hpp>

namespace custos::ecdsa {

// Only used for verification, which libsecp256k1 allows from several threads at once
static const secp256k1_context* default_context() {
    static secp256k1_context* context{secp256k1_context_create(SECP256K1_CONTEXT_VERIFY)};
    return context;
}

std::optional<Bytes> recover_public_key(ByteView digest, ByteView signature, bool odd_y_parity) noexcept {
    const secp256k1_context* context{default_context()};
    if (digest.size() != kHashLength || signature.size() != kCompactSignatureLength) {
        return std::nullopt;
    }

    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(context, &sig, signature.data(), odd_y_parity)) {
        return std::nullopt;
    }

    secp256k1_pubkey pub_key;
    if (!secp256k1_ecdsa_recover(context, &pub_key, &sig, digest.data())) {
        return std::nullopt;
    }

    size_t out_len{kUncompressedPublicKeyLength};
    Bytes out(out_len, '\0');
    secp256k1_ec_pubkey_serialize(context, out.data(), &out_len, &pub_key, SECP256K1_EC_UNCOMPRESSED);
    return out;
}

std::optional<evmc::address> recover_address(const evmc::bytes32& digest, const evmc::bytes32& r,
                                             const evmc::bytes32& s, uint8_t v) noexcept {
    if (v != kRecoveryIdOffset && v != kRecoveryIdOffset + 1) {
        return std::nullopt;
    }

    uint8_t signature[kCompactSignatureLength];
    std::memcpy(signature, r.bytes, kHashLength);
    std::memcpy(signature + kHashLength, s.bytes, kHashLength);

    const auto public_key{recover_public_key(ByteView{digest.bytes}, ByteView{signature}, v == kRecoveryIdOffset + 1)};
    if (!public_key) {
        return std::nullopt;
    }
    return public_key_to_address(*public_key);
}

}  // namespace custos::ecdsa
