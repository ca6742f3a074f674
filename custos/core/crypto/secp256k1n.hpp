// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"
// and EIP-2 for the low-S rule.

#include <intx/intx.hpp>

namespace custos {

// Order of the secp256k1 base point
inline constexpr intx::uint256 kSecp256k1n{
    intx::from_string<intx::uint256>("0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")};

inline constexpr intx::uint256 kSecp256k1Halfn{kSecp256k1n >> 1};

//! Whether r and s both lie in [1, N); high s is accepted
bool is_valid_signature(const intx::uint256& r, const intx::uint256& s) noexcept;

inline bool is_low_s(const intx::uint256& s) noexcept { return s <= kSecp256k1Halfn; }

//! \brief Canonical low-S representative of s (https://eips.ethereum.org/EIPS/eip-2)
//! \remarks (r, s) and (r, N - s) are both valid for the same message and key,
//! the latter recovering with the opposite y parity.
//! \pre s < kSecp256k1n
intx::uint256 normalize_s(const intx::uint256& s) noexcept;

}  // namespace custos
