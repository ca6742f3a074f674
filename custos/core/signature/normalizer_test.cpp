// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "normalizer.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <custos/core/common/util.hpp>
#include <custos/core/crypto/secp256k1n.hpp>
#include <custos/core/test_util/der.hpp>
#include <custos/core/test_util/signer.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>

namespace custos {

using namespace evmc::literals;
using test_util::kOtherSignerAddress;
using test_util::kTestSignerAddress;

static constexpr evmc::bytes32 kSampleDigest{0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32};

//! Recovery primitive recording every invocation and answering from a table indexed by v - 27
class FakeRecover {
  public:
    explicit FakeRecover(std::vector<std::optional<evmc::address>> answers) : answers_{std::move(answers)} {}

    RecoverAddressFunc func() {
        return [this](const evmc::bytes32&, const evmc::bytes32&, const evmc::bytes32&, uint8_t v) {
            calls_.push_back(v);
            return answers_.at(v - 27u);
        };
    }

    const std::vector<uint8_t>& calls() const { return calls_; }

  private:
    std::vector<std::optional<evmc::address>> answers_;
    std::vector<uint8_t> calls_;
};

TEST_CASE("normalize_signature with libsecp256k1 signatures", "[custos][signature][normalizer]") {
    const std::string expected{address_to_hex(kTestSignerAddress)};

    for (uint8_t recovery_id : {0, 1}) {
        const evmc::bytes32 digest{test_util::find_digest_with_recovery_id(recovery_id)};
        const auto signature{test_util::sign(digest)};

        SECTION("low-S as signed, recovery id " + std::to_string(recovery_id)) {
            const NormalizedSignature normalized{normalize_signature(signature.der, digest, expected)};
            CHECK(normalized.r == to_bytes32(signature.r));
            CHECK(normalized.s == to_bytes32(signature.s));
            CHECK(normalized.v == 27 + recovery_id);
            CHECK(ecdsa::recover_address(digest, normalized.r, normalized.s, normalized.v) == kTestSignerAddress);
        }

        SECTION("high-S counterpart, recovery id " + std::to_string(recovery_id)) {
            const Bytes high_s_der{test_util::encode_der_signature(signature.r, kSecp256k1n - signature.s)};
            const NormalizedSignature normalized{normalize_signature(high_s_der, digest, expected)};
            CHECK(to_uint256(normalized.s) <= kSecp256k1Halfn);
            CHECK(normalized.s == to_bytes32(signature.s));
            CHECK(normalized.v == 27 + recovery_id);
        }

        SECTION("long-form lengths, recovery id " + std::to_string(recovery_id)) {
            const Bytes long_form_der{test_util::encode_der_signature_long_form(signature.r, signature.s)};
            CHECK(normalize_signature(long_form_der, digest, expected) ==
                  normalize_signature(signature.der, digest, expected));
        }
    }
}

TEST_CASE("normalize_signature address comparison ignores case", "[custos][signature][normalizer]") {
    const evmc::bytes32 digest{test_util::find_digest_with_recovery_id(1)};
    const auto signature{test_util::sign(digest)};

    const NormalizedSignature reference{normalize_signature(signature.der, digest, kTestSignerAddress)};
    CHECK(reference.v == 28);

    for (const std::string_view spelling : {"0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266",
                                            "0xF39FD6E51AAD88F6F4CE6AB8827279CFFFB92266",
                                            "0xf39Fd6e51aad88F6F4ce6aB8827279cffFb92266"}) {
        CHECK(normalize_signature(signature.der, digest, spelling) == reference);
    }
}

TEST_CASE("normalize_signature from a different signer", "[custos][signature][normalizer]") {
    const evmc::bytes32 digest{test_util::find_digest_with_recovery_id(0)};
    const auto signature{test_util::sign(digest)};
    const std::string expected{address_to_hex(kOtherSignerAddress)};

    try {
        (void)normalize_signature(signature.der, digest, expected);
        FAIL("RecoveryFailureException expected");
    } catch (const RecoveryFailureException& ex) {
        CHECK(ex.expected() == expected);
        CHECK(ex.recovered_at_27() == kTestSignerAddress);
        CHECK(ex.recovered_at_28() != kTestSignerAddress);
        CHECK(ex.recovered_at_28() != kOtherSignerAddress);
    }
}

TEST_CASE("normalize_signature with malformed DER", "[custos][signature][normalizer]") {
    FakeRecover fake{{kTestSignerAddress, kTestSignerAddress}};
    const std::string expected{address_to_hex(kTestSignerAddress)};

    const auto check_malformed = [&](std::string_view der_hex, DerError expected_error) {
        try {
            (void)normalize_signature(*from_hex(der_hex), kSampleDigest, expected, fake.func());
            FAIL("MalformedSignatureException expected");
        } catch (const MalformedSignatureException& ex) {
            CHECK(ex.err() == expected_error);
            CHECK(std::string{ex.what()} == der_error_message(expected_error));
        }
    };

    SECTION("integer tag missing") {
        check_malformed("300400010101", DerError::kMissingInteger);
    }
    SECTION("sequence tag missing") {
        check_malformed("00020101", DerError::kMissingSequence);
    }
    SECTION("truncated") {
        check_malformed("30060201", DerError::kIntegerOutOfBounds);
        check_malformed("", DerError::kUnexpectedEnd);
    }
    SECTION("zero r") {
        check_malformed(to_hex(test_util::encode_der_signature(0, 1)), DerError::kScalarOutOfRange);
    }
    SECTION("s equal to the curve order") {
        check_malformed(to_hex(test_util::encode_der_signature(1, kSecp256k1n)), DerError::kScalarOutOfRange);
    }

    CHECK(fake.calls().empty());
}

TEST_CASE("resolve_v candidate order", "[custos][signature][normalizer]") {
    const evmc::bytes32 r{to_bytes32(intx::uint256{1})};
    const evmc::bytes32 s{to_bytes32(intx::uint256{2})};
    const std::string expected{address_to_hex(kTestSignerAddress)};

    SECTION("both candidates match: 27 wins without trying 28") {
        FakeRecover fake{{kTestSignerAddress, kTestSignerAddress}};
        CHECK(resolve_v(kSampleDigest, r, s, expected, fake.func()).v == 27);
        CHECK(fake.calls() == std::vector<uint8_t>{27});
    }

    SECTION("second candidate matches") {
        FakeRecover fake{{kOtherSignerAddress, kTestSignerAddress}};
        const NormalizedSignature normalized{resolve_v(kSampleDigest, r, s, expected, fake.func())};
        CHECK(normalized.r == r);
        CHECK(normalized.s == s);
        CHECK(normalized.v == 28);
        CHECK(fake.calls() == std::vector<uint8_t>{27, 28});
    }

    SECTION("no candidate matches") {
        FakeRecover fake{{kOtherSignerAddress, 0x0000000000000000000000000000000000000001_address}};
        CHECK_THROWS_AS(resolve_v(kSampleDigest, r, s, expected, fake.func()), RecoveryFailureException);
        CHECK(fake.calls() == std::vector<uint8_t>{27, 28});
    }

    SECTION("recovery primitive fails on first candidate") {
        FakeRecover fake{{std::nullopt, kTestSignerAddress}};
        try {
            (void)resolve_v(kSampleDigest, r, s, expected, fake.func());
            FAIL("SignatureRecoveryException expected");
        } catch (const SignatureRecoveryException& ex) {
            CHECK(ex.v() == 27);
        }
        CHECK(fake.calls() == std::vector<uint8_t>{27});
    }

    SECTION("recovery primitive fails on second candidate") {
        FakeRecover fake{{kOtherSignerAddress, std::nullopt}};
        try {
            (void)resolve_v(kSampleDigest, r, s, expected, fake.func());
            FAIL("SignatureRecoveryException expected");
        } catch (const SignatureRecoveryException& ex) {
            CHECK(ex.v() == 28);
        }
    }
}

TEST_CASE("normalize_signature is deterministic", "[custos][signature][normalizer]") {
    const auto signature{test_util::sign(kSampleDigest)};
    const std::string expected{address_to_hex(kTestSignerAddress)};
    CHECK(normalize_signature(signature.der, kSampleDigest, expected) ==
          normalize_signature(signature.der, kSampleDigest, expected));
}

TEST_CASE("serialize_signature", "[custos][signature][normalizer]") {
    const NormalizedSignature signature{
        .r = 0x00000000000000000000000000000000000000000000000000000000000000aa_bytes32,
        .s = 0x00000000000000000000000000000000000000000000000000000000000000bb_bytes32,
        .v = 28,
    };
    const Bytes serialized{serialize_signature(signature)};
    REQUIRE(serialized.size() == kSerializedSignatureLength);
    CHECK(serialized[31] == 0xaa);
    CHECK(serialized[63] == 0xbb);
    CHECK(serialized[64] == 28);
}

}  // namespace custos
