// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <custos/core/common/bytes.hpp>

namespace custos {

// Converts bytes to evmc::bytes32; short inputs are left-padded with 0s, long ones cropped.
evmc::bytes32 to_bytes32(ByteView bytes);

// Big-endian fixed-width word
evmc::bytes32 to_bytes32(const intx::uint256& value) noexcept;

intx::uint256 to_uint256(const evmc::bytes32& value) noexcept;

// Parses exactly 32 bytes of hex, with or without 0x prefix
std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

}  // namespace custos
