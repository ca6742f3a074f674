// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "local_key_provider.hpp"

#include <stdexcept>
#include <string>

#include <custos/core/common/util.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/core/types/y_parity_and_chain_id.hpp>
#include <custos/infra/common/ensure.hpp>
#include <custos/infra/common/log.hpp>

namespace custos {

LocalKeyProvider::LocalKeyProvider(ByteView private_key) : private_key_{private_key} {
    const auto public_key{context_.public_key_of(private_key_)};
    ensure_pre_condition(public_key.has_value(), [] { return std::string{"Local Provider: invalid private key"}; });
    const auto address{public_key_to_address(*public_key)};
    ensure_invariant(address.has_value(), "cannot derive address");
    address_ = *address;

    log::Info("Local key loaded", {"address", address_to_hex(address_)});
}

std::unique_ptr<LocalKeyProvider> LocalKeyProvider::from_hex(std::string_view hex) {
    const auto private_key{custos::from_hex(hex)};
    if (!private_key) {
        throw std::invalid_argument("Local Provider: private key is not valid hex");
    }
    return std::make_unique<LocalKeyProvider>(*private_key);
}

NormalizedSignature LocalKeyProvider::sign_digest(const evmc::bytes32& digest) {
    std::scoped_lock lock{context_mutex_};

    const auto signature{context_.sign_recoverable(digest, private_key_)};
    ensure_invariant(signature.has_value(), "secp256k1 signing failed");

    const NormalizedSignature normalized{
        .r = signature->r,
        .s = signature->s,
        .v = static_cast<uint8_t>(kRecoveryIdOffset + signature->recovery_id),
    };
    CUSTOS_DEBUG << "Local key signed" << log::Args{"digest", to_hex(digest, true), "v", std::to_string(normalized.v)};
    return normalized;
}

}  // namespace custos
