// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include <evmc/evmc.hpp>

#include <custos/core/common/bytes.hpp>
#include <custos/core/crypto/ecdsa.hpp>
#include <custos/core/signature/signature_exception.hpp>

namespace custos {

//! Fixed-width Ethereum signature: 32-byte big-endian r and low s, v in {27, 28}
struct NormalizedSignature {
    evmc::bytes32 r;
    evmc::bytes32 s;
    uint8_t v{0};

    friend bool operator==(const NormalizedSignature&, const NormalizedSignature&) = default;
};

//! Recovers the signer of digest from (r, s, v), std::nullopt when no public key can be recovered
using RecoverAddressFunc = std::function<std::optional<evmc::address>(
    const evmc::bytes32& digest, const evmc::bytes32& r, const evmc::bytes32& s, uint8_t v)>;

//! \brief Finds the v which makes (r, s, v) recover expected_address
//! \details v = 27 is tried first, then v = 28; when both recover the expected address 27 wins.
//! Addresses are compared ignoring letter case.
//! \throws RecoveryFailureException when neither candidate recovers expected_address
//! \throws SignatureRecoveryException when recover yields no address for a candidate
NormalizedSignature resolve_v(const evmc::bytes32& digest, const evmc::bytes32& r, const evmc::bytes32& s,
                              std::string_view expected_address,
                              const RecoverAddressFunc& recover = ecdsa::recover_address);

//! \brief Turns a DER encoded ECDSA signature, as returned by a KMS, into a canonical (r, s, v)
//! \param [in] der : ASN.1 DER SEQUENCE { r INTEGER, s INTEGER }
//! \param [in] digest : the 32-byte digest that was signed
//! \param [in] expected_address : hex address of the signing key
//! \param [in] recover : recovery primitive, libsecp256k1 based by default
//! \throws MalformedSignatureException on decoding failure, before any recovery attempt
//! \throws RecoveryFailureException, SignatureRecoveryException as resolve_v
NormalizedSignature normalize_signature(ByteView der, const evmc::bytes32& digest, std::string_view expected_address,
                                        const RecoverAddressFunc& recover = ecdsa::recover_address);

NormalizedSignature normalize_signature(ByteView der, const evmc::bytes32& digest,
                                        const evmc::address& expected_address,
                                        const RecoverAddressFunc& recover = ecdsa::recover_address);

//! 65 bytes r || s || v
Bytes serialize_signature(const NormalizedSignature& signature);

}  // namespace custos
