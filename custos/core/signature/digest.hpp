// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <evmc/evmc.hpp>

#include <custos/core/common/bytes.hpp>

namespace custos {

inline constexpr std::string_view kPersonalMessagePrefix{"\x19" "Ethereum Signed Message:\n"};

//! EIP-191 version 0x45: keccak256("\x19Ethereum Signed Message:\n" || len(message) || message)
evmc::bytes32 hash_message(ByteView message);

//! EIP-712: keccak256(0x19 || 0x01 || domain_separator || struct_hash)
evmc::bytes32 hash_typed_data(const evmc::bytes32& domain_separator, const evmc::bytes32& struct_hash);

//! Digest of an already serialized unsigned transaction payload
evmc::bytes32 hash_transaction(ByteView unsigned_payload);

}  // namespace custos
