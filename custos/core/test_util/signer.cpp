// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "signer.hpp"

#include <stdexcept>
#include <string>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <custos/core/common/base.hpp>
#include <custos/core/types/evmc_bytes32.hpp>

namespace custos::test_util {

TestSignature sign(const evmc::bytes32& digest, const evmc::bytes32& private_key) {
    static secp256k1_context* context{secp256k1_context_create(SECP256K1_CONTEXT_SIGN)};

    secp256k1_ecdsa_recoverable_signature recoverable;
    if (!secp256k1_ecdsa_sign_recoverable(context, &recoverable, digest.bytes, private_key.bytes, nullptr, nullptr)) {
        throw std::runtime_error("secp256k1_ecdsa_sign_recoverable failed");
    }

    TestSignature signature;
    uint8_t compact[kCompactSignatureLength];
    int recovery_id{0};
    secp256k1_ecdsa_recoverable_signature_serialize_compact(context, compact, &recovery_id, &recoverable);
    signature.r = intx::be::unsafe::load<intx::uint256>(compact);
    signature.s = intx::be::unsafe::load<intx::uint256>(compact + kHashLength);
    signature.recovery_id = static_cast<uint8_t>(recovery_id);

    secp256k1_ecdsa_signature plain;
    secp256k1_ecdsa_recoverable_signature_convert(context, &plain, &recoverable);
    uint8_t der[72];
    size_t der_size{sizeof(der)};
    secp256k1_ecdsa_signature_serialize_der(context, der, &der_size, &plain);
    signature.der.assign(der, der_size);
    return signature;
}

evmc::bytes32 find_digest_with_recovery_id(uint8_t recovery_id, const evmc::bytes32& private_key) {
    for (uint64_t i{0}; i < 256; ++i) {
        const evmc::bytes32 digest{to_bytes32(intx::uint256{i + 1})};
        if (sign(digest, private_key).recovery_id == recovery_id) {
            return digest;
        }
    }
    throw std::runtime_error("no digest found for recovery id " + std::to_string(recovery_id));
}

}  // namespace custos::test_util
