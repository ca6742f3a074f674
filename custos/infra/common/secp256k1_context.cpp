// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_context.hpp"

#include <cstring>

#include <secp256k1_recovery.h>

#include <custos/core/common/base.hpp>

namespace custos {

SecP256K1Context::SecP256K1Context() : context_{secp256k1_context_create(SECP256K1_CONTEXT_SIGN)} {}

SecP256K1Context::~SecP256K1Context() { secp256k1_context_destroy(context_); }

bool SecP256K1Context::is_valid_private_key(ByteView private_key) const {
    return private_key.size() == kPrivateKeyLength && secp256k1_ec_seckey_verify(context_, private_key.data()) == 1;
}

std::optional<Bytes> SecP256K1Context::public_key_of(ByteView private_key) const {
    if (!is_valid_private_key(private_key)) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ec_pubkey_create(context_, &public_key, private_key.data())) {
        return std::nullopt;
    }
    Bytes serialized(kUncompressedPublicKeyLength, 0);
    size_t size{serialized.size()};
    secp256k1_ec_pubkey_serialize(context_, serialized.data(), &size, &public_key, SECP256K1_EC_UNCOMPRESSED);
    return serialized;
}

std::optional<RecoverableSignature> SecP256K1Context::sign_recoverable(const evmc::bytes32& digest,
                                                                       ByteView private_key) {
    if (!is_valid_private_key(private_key)) {
        return std::nullopt;
    }
    secp256k1_ecdsa_recoverable_signature signature;
    if (!secp256k1_ecdsa_sign_recoverable(context_, &signature, digest.bytes, private_key.data(), nullptr, nullptr)) {
        return std::nullopt;
    }

    uint8_t compact[kCompactSignatureLength];
    int recovery_id{0};
    secp256k1_ecdsa_recoverable_signature_serialize_compact(context_, compact, &recovery_id, &signature);

    RecoverableSignature result;
    std::memcpy(result.r.bytes, compact, kHashLength);
    std::memcpy(result.s.bytes, compact + kHashLength, kHashLength);
    result.recovery_id = static_cast<uint8_t>(recovery_id);
    return result;
}

}  // namespace custos
