// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <evmc/evmc.hpp>

#include <custos/core/common/bytes.hpp>
#include <custos/provider/signing_provider.hpp>

namespace custos {

//! Ethereum account on top of any SigningProvider: hashes messages, typed data and transactions
//! then delegates the digest signature to the provider
class Account {
  public:
    explicit Account(std::unique_ptr<SigningProvider> provider);

    evmc::address address();

    NormalizedSignature sign_digest(const evmc::bytes32& digest);

    //! EIP-191 personal message
    NormalizedSignature sign_message(ByteView message);

    //! EIP-712 typed data, given its domain separator and struct hash
    NormalizedSignature sign_typed_data(const evmc::bytes32& domain_separator, const evmc::bytes32& struct_hash);

    //! Serialized unsigned transaction payload
    NormalizedSignature sign_transaction(ByteView unsigned_payload);

  private:
    std::unique_ptr<SigningProvider> provider_;
};

}  // namespace custos
