// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "digest.hpp"

#include <string_view>

#include <catch2/catch_test_macros.hpp>

#include <custos/core/common/bytes_to_string.hpp>
#include <custos/core/common/util.hpp>

namespace custos {

using namespace evmc::literals;

TEST_CASE("hash_message", "[custos][signature][digest]") {
    CHECK(hash_message(string_view_to_byte_view("Hello World")) ==
          0xa1de988600a42c4b4ab089b619297c17d53cffae5d5120d82d8a92d0bb3b78f2_bytes32);

    // Length is spelled out in decimal
    const Bytes message(12, 0x61);
    const auto preimage{*from_hex("19457468657265756d205369676e6564204d6573736167653a0a3132616161616161616161616161")};
    CHECK(hash_message(message) == hash_transaction(preimage));
}

TEST_CASE("hash_typed_data", "[custos][signature][digest]") {
    const auto domain{0x1111111111111111111111111111111111111111111111111111111111111111_bytes32};
    const auto message{0x2222222222222222222222222222222222222222222222222222222222222222_bytes32};
    const auto preimage{*from_hex(
        "1901"
        "1111111111111111111111111111111111111111111111111111111111111111"
        "2222222222222222222222222222222222222222222222222222222222222222")};
    CHECK(hash_typed_data(domain, message) == hash_transaction(preimage));
    CHECK(hash_typed_data(message, domain) != hash_typed_data(domain, message));
}

TEST_CASE("hash_transaction", "[custos][signature][digest]") {
    CHECK(hash_transaction({}) == 0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32);
}

}  // namespace custos
