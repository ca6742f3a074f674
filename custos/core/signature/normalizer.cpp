// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "normalizer.hpp"

#include <string>

#include <custos/core/common/base.hpp>
#include <custos/core/crypto/secp256k1n.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/core/types/y_parity_and_chain_id.hpp>

namespace custos {

NormalizedSignature resolve_v(const evmc::bytes32& digest, const evmc::bytes32& r, const evmc::bytes32& s,
                              std::string_view expected_address, const RecoverAddressFunc& recover) {
    evmc::address recovered[2];
    for (uint8_t parity{0}; parity < 2; ++parity) {
        const uint8_t v = kRecoveryIdOffset + parity;
        const std::optional<evmc::address> address{recover(digest, r, s, v)};
        if (!address) {
            throw SignatureRecoveryException{v};
        }
        if (address_matches(expected_address, *address)) {
            return {r, s, v};
        }
        recovered[parity] = *address;
    }
    throw RecoveryFailureException{expected_address, recovered[0], recovered[1]};
}

NormalizedSignature normalize_signature(ByteView der, const evmc::bytes32& digest, std::string_view expected_address,
                                        const RecoverAddressFunc& recover) {
    const auto decoded{decode_der_signature(der)};
    if (!decoded) {
        throw MalformedSignatureException{decoded.error()};
    }
    if (!is_valid_signature(decoded->r, decoded->s)) {
        throw MalformedSignatureException{DerError::kScalarOutOfRange};
    }

    const evmc::bytes32 r{to_bytes32(decoded->r)};
    const evmc::bytes32 s{to_bytes32(normalize_s(decoded->s))};
    return resolve_v(digest, r, s, expected_address, recover);
}

NormalizedSignature normalize_signature(ByteView der, const evmc::bytes32& digest,
                                        const evmc::address& expected_address, const RecoverAddressFunc& recover) {
    return normalize_signature(der, digest, address_to_hex(expected_address), recover);
}

Bytes serialize_signature(const NormalizedSignature& signature) {
    Bytes out;
    out.reserve(kSerializedSignatureLength);
    out.append(signature.r.bytes, kHashLength);
    out.append(signature.s.bytes, kHashLength);
    out.push_back(signature.v);
    return out;
}

}  // namespace custos
