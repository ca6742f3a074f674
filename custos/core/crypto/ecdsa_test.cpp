// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <catch2/catch_test_macros.hpp>

#include <custos/core/common/base.hpp>
#include <custos/core/crypto/secp256k1n.hpp>
#include <custos/core/test_util/signer.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/core/types/y_parity_and_chain_id.hpp>

namespace custos::ecdsa {

using namespace evmc::literals;

TEST_CASE("recover_address", "[custos][crypto][ecdsa]") {
    const evmc::bytes32 digest{0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32};
    const auto signature{test_util::sign(digest)};
    const evmc::bytes32 r{to_bytes32(signature.r)};
    const evmc::bytes32 s{to_bytes32(signature.s)};
    const uint8_t v = kRecoveryIdOffset + signature.recovery_id;

    SECTION("matching v") {
        CHECK(recover_address(digest, r, s, v) == test_util::kTestSignerAddress);
    }

    SECTION("opposite v recovers another key") {
        const uint8_t other_v = v == 27 ? 28 : 27;
        const auto address{recover_address(digest, r, s, other_v)};
        REQUIRE(address.has_value());
        CHECK(*address != test_util::kTestSignerAddress);
    }

    SECTION("v outside 27 and 28") {
        CHECK_FALSE(recover_address(digest, r, s, signature.recovery_id).has_value());
        CHECK_FALSE(recover_address(digest, r, s, 29).has_value());
    }

    SECTION("zero r") {
        CHECK_FALSE(recover_address(digest, evmc::bytes32{}, s, v).has_value());
    }

    SECTION("r not below the curve order") {
        CHECK_FALSE(recover_address(digest, to_bytes32(kSecp256k1n), s, v).has_value());
    }
}

TEST_CASE("recover_public_key", "[custos][crypto][ecdsa]") {
    const evmc::bytes32 digest{0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32};
    const auto signature{test_util::sign(digest)};
    uint8_t compact[kCompactSignatureLength];
    intx::be::unsafe::store(compact, signature.r);
    intx::be::unsafe::store(compact + kHashLength, signature.s);

    const auto public_key{recover_public_key(ByteView{digest.bytes}, ByteView{compact}, signature.recovery_id == 1)};
    REQUIRE(public_key.has_value());
    CHECK(public_key->size() == kUncompressedPublicKeyLength);
    CHECK((*public_key)[0] == 0x04);
    CHECK(public_key_to_address(*public_key) == test_util::kTestSignerAddress);

    CHECK_FALSE(recover_public_key(ByteView{digest.bytes}, ByteView{compact}.substr(1), false).has_value());
}

}  // namespace custos::ecdsa
