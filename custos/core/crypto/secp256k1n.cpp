// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1n.hpp"

namespace custos {

bool is_valid_signature(const intx::uint256& r, const intx::uint256& s) noexcept {
    return r != 0 && s != 0 && r < kSecp256k1n && s < kSecp256k1n;
}

intx::uint256 normalize_s(const intx::uint256& s) noexcept {
    if (is_low_s(s)) {
        return s;
    }
    return kSecp256k1n - s;
}

}  // namespace custos
