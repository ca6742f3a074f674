// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"

#include <utility>

#include <custos/core/signature/digest.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/infra/common/ensure.hpp>
#include <custos/infra/common/log.hpp>

namespace custos {

Account::Account(std::unique_ptr<SigningProvider> provider) : provider_{std::move(provider)} {
    ensure(provider_ != nullptr, "Account: null signing provider");
}

evmc::address Account::address() {
    return provider_->address();
}

NormalizedSignature Account::sign_digest(const evmc::bytes32& digest) {
    CUSTOS_TRACE << "Account::sign_digest digest=" << to_hex(digest, true);
    return provider_->sign_digest(digest);
}

NormalizedSignature Account::sign_message(ByteView message) {
    return sign_digest(hash_message(message));
}

NormalizedSignature Account::sign_typed_data(const evmc::bytes32& domain_separator, const evmc::bytes32& struct_hash) {
    return sign_digest(hash_typed_data(domain_separator, struct_hash));
}

NormalizedSignature Account::sign_transaction(ByteView unsigned_payload) {
    return sign_digest(hash_transaction(unsigned_payload));
}

}  // namespace custos
