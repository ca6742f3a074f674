// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_context.hpp"

#include <catch2/catch_test_macros.hpp>

#include <custos/core/common/base.hpp>
#include <custos/core/crypto/ecdsa.hpp>
#include <custos/core/crypto/secp256k1n.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/core/types/y_parity_and_chain_id.hpp>

namespace custos {

using namespace evmc::literals;

static constexpr evmc::bytes32 kPrivateKey{0xac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80_bytes32};
static constexpr evmc::address kSigner{0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266_address};
static constexpr evmc::bytes32 kDigest{0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32};

TEST_CASE("SecP256K1Context private key", "[custos][infra][secp256k1]") {
    SecP256K1Context context;
    CHECK(context.is_valid_private_key(ByteView{kPrivateKey.bytes}));
    CHECK_FALSE(context.is_valid_private_key(ByteView{evmc::bytes32{}.bytes}));
    CHECK_FALSE(context.is_valid_private_key(ByteView{to_bytes32(kSecp256k1n).bytes}));
    CHECK_FALSE(context.is_valid_private_key(ByteView{kPrivateKey.bytes}.substr(1)));

    const auto public_key{context.public_key_of(ByteView{kPrivateKey.bytes})};
    REQUIRE(public_key.has_value());
    CHECK(public_key->size() == kUncompressedPublicKeyLength);
    CHECK((*public_key)[0] == 0x04);
    CHECK(public_key_to_address(*public_key) == kSigner);

    CHECK_FALSE(context.public_key_of(ByteView{evmc::bytes32{}.bytes}).has_value());
}

TEST_CASE("SecP256K1Context recoverable signatures", "[custos][infra][secp256k1]") {
    SecP256K1Context context;

    SECTION("invalid private key") {
        CHECK_FALSE(context.sign_recoverable(kDigest, ByteView{evmc::bytes32{}.bytes}).has_value());
    }

    SECTION("signature recovers the signer") {
        const auto signature{context.sign_recoverable(kDigest, ByteView{kPrivateKey.bytes})};
        REQUIRE(signature.has_value());
        REQUIRE(signature->recovery_id <= 1);
        CHECK(is_low_s(to_uint256(signature->s)));
        const auto v{static_cast<uint8_t>(kRecoveryIdOffset + signature->recovery_id)};
        CHECK(ecdsa::recover_address(kDigest, signature->r, signature->s, v) == kSigner);
    }

    SECTION("deterministic") {
        const auto first{context.sign_recoverable(kDigest, ByteView{kPrivateKey.bytes})};
        const auto second{context.sign_recoverable(kDigest, ByteView{kPrivateKey.bytes})};
        REQUIRE((first && second));
        CHECK(first->r == second->r);
        CHECK(first->s == second->s);
        CHECK(first->recovery_id == second->recovery_id);
    }
}

}  // namespace custos
