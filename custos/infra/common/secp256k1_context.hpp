// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>

#include <evmc/evmc.hpp>
#include <gsl/pointers>
#include <secp256k1.h>

#include <custos/core/common/bytes.hpp>

namespace custos {

//! Recoverable signature split into 32-byte words; libsecp256k1 always returns low s
struct RecoverableSignature {
    evmc::bytes32 r;
    evmc::bytes32 s;
    uint8_t recovery_id{0};
};

//! Signing-capable libsecp256k1 context.
//! Not safe for concurrent signing: each signer owns one and serializes its calls.
class SecP256K1Context final {
  public:
    SecP256K1Context();
    ~SecP256K1Context();

    SecP256K1Context(const SecP256K1Context&) = delete;
    SecP256K1Context& operator=(const SecP256K1Context&) = delete;

    //! 32 bytes in [1, N)
    bool is_valid_private_key(ByteView private_key) const;

    //! Uncompressed SEC1 public key (0x04 || X || Y), std::nullopt for an invalid private key
    std::optional<Bytes> public_key_of(ByteView private_key) const;

    //! std::nullopt for an invalid private key
    std::optional<RecoverableSignature> sign_recoverable(const evmc::bytes32& digest, ByteView private_key);

  private:
    gsl::owner<secp256k1_context*> context_;
};

}  // namespace custos
