// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>
#include <string_view>

#include <custos/core/common/bytes.hpp>
#include <custos/infra/common/secp256k1_context.hpp>
#include <custos/provider/signing_provider.hpp>

namespace custos {

//! Signs with a raw secp256k1 private key held in process memory
class LocalKeyProvider : public SigningProvider {
  public:
    //! \throws std::invalid_argument if private_key is not a valid 32-byte secp256k1 secret
    explicit LocalKeyProvider(ByteView private_key);

    //! \throws std::invalid_argument if hex does not encode a valid private key
    static std::unique_ptr<LocalKeyProvider> from_hex(std::string_view hex);

    evmc::address address() override { return address_; }

    NormalizedSignature sign_digest(const evmc::bytes32& digest) override;

  private:
    SecP256K1Context context_;
    std::mutex context_mutex_;
    Bytes private_key_;
    evmc::address address_;
};

}  // namespace custos
