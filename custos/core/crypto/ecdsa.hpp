// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"

#include <optional>

#include <evmc/evmc.hpp>

#include <custos/core/common/bytes.hpp>

namespace custos::ecdsa {

//! \brief Tries recover the uncompressed public key (0x04 || X || Y) used for message signing.
//! \param [in] digest : the signed 32-byte digest
//! \param [in] signature : the compact 64-byte signature r || s
//! \param [in] odd_y_parity : whether y parity is odd (i.e. recovery id 1)
//! \return An optional Bytes. Should it has no value the recovery has failed
std::optional<Bytes> recover_public_key(ByteView digest, ByteView signature, bool odd_y_parity) noexcept;

//! \brief Tries recover the address used for signing digest with (r, s, v)
//! \param [in] v : 27 or 28; any other value fails the recovery
//! \return std::nullopt when the recovery fails, e.g. r is not the x coordinate of a curve point
std::optional<evmc::address> recover_address(const evmc::bytes32& digest, const evmc::bytes32& r,
                                             const evmc::bytes32& s, uint8_t v) noexcept;

}  // namespace custos::ecdsa
