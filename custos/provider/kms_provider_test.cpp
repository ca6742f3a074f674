// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "kms_provider.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <custos/core/common/util.hpp>
#include <custos/core/crypto/ecdsa.hpp>
#include <custos/core/crypto/secp256k1n.hpp>
#include <custos/core/test_util/signer.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/provider/test_util/fake_clients.hpp>

namespace custos {

using namespace evmc::literals;

static constexpr evmc::bytes32 kDigest{0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32};

TEST_CASE("spki_from_pem", "[custos][provider][kms]") {
    const Bytes spki{test_util::spki_of(test_util::kTestPrivateKey)};
    REQUIRE(spki.size() == 88);

    SECTION("round trip") {
        CHECK(spki_from_pem(test_util::to_pem(spki)) == spki);
    }

    SECTION("windows line endings") {
        std::string pem{test_util::to_pem(spki)};
        std::string crlf;
        for (const char c : pem) {
            if (c == '\n') crlf += '\r';
            crlf += c;
        }
        CHECK(spki_from_pem(crlf) == spki);
    }

    SECTION("invalid armour") {
        CHECK_FALSE(spki_from_pem("").has_value());
        CHECK_FALSE(spki_from_pem("-----BEGIN PUBLIC KEY-----\n-----END PUBLIC KEY-----").has_value());
        CHECK_FALSE(spki_from_pem("-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----").has_value());
        CHECK_FALSE(spki_from_pem("-----BEGIN PUBLIC KEY-----\n!!!!\n-----END PUBLIC KEY-----").has_value());
    }
}

TEST_CASE("spki_to_address", "[custos][provider][kms]") {
    CHECK(spki_to_address(test_util::spki_of(test_util::kTestPrivateKey)) == test_util::kTestSignerAddress);
    CHECK(spki_to_address(test_util::spki_of(test_util::kOtherPrivateKey)) == test_util::kOtherSignerAddress);
    CHECK_FALSE(spki_to_address(*from_hex("3056301006072a8648ce3d0201")).has_value());
}

TEST_CASE("KmsProvider", "[custos][provider][kms]") {
    auto client{std::make_shared<test_util::FakeKmsClient>(test_util::kTestPrivateKey)};
    KmsProvider provider{KmsSettings{.key_id = "alias/custos-test"}, client};
    CHECK(provider.settings().region == "us-east-1");

    SECTION("address fetched once") {
        CHECK(provider.address() == test_util::kTestSignerAddress);
        CHECK(provider.address() == test_util::kTestSignerAddress);
        CHECK(client->public_key_calls == 1);
    }

    SECTION("client calling back into address while the key is fetched") {
        bool reentered{false};
        std::optional<evmc::address> nested;
        client->on_get_public_key = [&] {
            if (reentered) return;
            reentered = true;
            nested = provider.address();
        };
        CHECK(provider.address() == test_util::kTestSignerAddress);
        CHECK(nested == test_util::kTestSignerAddress);
        CHECK(client->public_key_calls == 2);

        // published once, later calls hit the cache
        CHECK(provider.address() == test_util::kTestSignerAddress);
        CHECK(client->public_key_calls == 2);
    }

    SECTION("low-S signature") {
        const NormalizedSignature signature{provider.sign_digest(kDigest)};
        CHECK(ecdsa::recover_address(kDigest, signature.r, signature.s, signature.v) == test_util::kTestSignerAddress);
        CHECK(client->signing_key_ids == std::vector<std::string>{"alias/custos-test"});
    }

    SECTION("high-S signature is normalized") {
        const NormalizedSignature low{provider.sign_digest(kDigest)};
        client->high_s = true;
        const NormalizedSignature normalized{provider.sign_digest(kDigest)};
        CHECK(is_low_s(to_uint256(normalized.s)));
        CHECK(normalized == low);
    }

    SECTION("public key missing") {
        client->public_key = std::nullopt;
        CHECK_THROWS_AS(provider.address(), KmsException);
        CHECK_THROWS_AS(provider.sign_digest(kDigest), KmsException);
    }

    SECTION("signature missing") {
        client->fail_signing = true;
        CHECK_THROWS_AS(provider.sign_digest(kDigest), KmsException);
    }

    SECTION("malformed signature") {
        client->forced_signature = *from_hex("300400010101");
        try {
            (void)provider.sign_digest(kDigest);
            FAIL("MalformedSignatureException expected");
        } catch (const MalformedSignatureException& ex) {
            CHECK(ex.err() == DerError::kMissingInteger);
        }
    }

    SECTION("public key of another key") {
        client->public_key = test_util::spki_of(test_util::kOtherPrivateKey);
        CHECK_THROWS_AS(provider.sign_digest(kDigest), RecoveryFailureException);
    }
}

TEST_CASE("KmsProvider preconditions", "[custos][provider][kms]") {
    auto client{std::make_shared<test_util::FakeKmsClient>(test_util::kTestPrivateKey)};
    CHECK_THROWS_AS(KmsProvider(KmsSettings{}, client), std::invalid_argument);
    CHECK_THROWS_AS(KmsProvider(KmsSettings{.key_id = "key"}, nullptr), std::logic_error);
}

}  // namespace custos
