// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <custos/core/common/bytes.hpp>

namespace custos::test_util {

using namespace evmc::literals;

// First development account of the Hardhat/Anvil test mnemonic
inline constexpr evmc::bytes32 kTestPrivateKey{0xac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80_bytes32};
inline constexpr evmc::address kTestSignerAddress{0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266_address};

// Second development account of the same mnemonic
inline constexpr evmc::bytes32 kOtherPrivateKey{0x59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d_bytes32};
inline constexpr evmc::address kOtherSignerAddress{0x70997970c51812dc3a010c7d01b50e0d17dc79c8_address};

//! Signature as libsecp256k1 produces it: always low-S
struct TestSignature {
    Bytes der;
    intx::uint256 r;
    intx::uint256 s;
    uint8_t recovery_id{0};
};

TestSignature sign(const evmc::bytes32& digest, const evmc::bytes32& private_key = kTestPrivateKey);

//! Digest for which the test key signs with the requested recovery id
evmc::bytes32 find_digest_with_recovery_id(uint8_t recovery_id, const evmc::bytes32& private_key = kTestPrivateKey);

}  // namespace custos::test_util
