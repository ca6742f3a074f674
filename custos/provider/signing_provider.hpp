// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <custos/core/signature/normalizer.hpp>

namespace custos {

//! A key custody backend able to sign 32-byte digests with a secp256k1 key
class SigningProvider {
  public:
    virtual ~SigningProvider() = default;

    //! Address of the signing key; may contact the backend
    virtual evmc::address address() = 0;

    //! Canonical (r, s, v) over digest, low-S with v in {27, 28}
    virtual NormalizedSignature sign_digest(const evmc::bytes32& digest) = 0;
};

}  // namespace custos
