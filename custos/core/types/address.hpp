// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <custos/core/common/bytes.hpp>

namespace custos {

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

// Parses a 20-byte address from hex, with or without 0x prefix and in any letter case.
// Returns std::nullopt if hex is not a valid encoding of exactly 20 bytes.
std::optional<evmc::address> hex_to_address(std::string_view hex);

// Lower-case hex with 0x prefix
std::string address_to_hex(const evmc::address& address);

// Compares a textual address to a binary one ignoring letter case and tolerating a missing 0x prefix
bool address_matches(std::string_view hex, const evmc::address& address);

// Yellow Paper, Appendix F: the rightmost 160 bits of the Keccak hash of the 64-byte public key X || Y.
// Accepts either the 65-byte uncompressed SEC1 form (0x04 || X || Y) or the bare 64 bytes.
std::optional<evmc::address> public_key_to_address(ByteView public_key) noexcept;

}  // namespace custos

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
