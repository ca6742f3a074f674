// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "y_parity_and_chain_id.hpp"

namespace custos {

static constexpr uint64_t kEip155Offset{35};

std::optional<YParityAndChainId> v_to_y_parity_and_chain_id(const intx::uint256& v) noexcept {
    if (v <= 1) {
        return YParityAndChainId{.odd = v == 1};
    }
    if (v == kRecoveryIdOffset || v == kRecoveryIdOffset + 1) {
        return YParityAndChainId{.odd = v == kRecoveryIdOffset + 1};
    }
    if (v < kEip155Offset) {
        return std::nullopt;
    }
    const intx::uint256 parity_and_chain{v - kEip155Offset};
    return YParityAndChainId{
        .odd = (static_cast<uint64_t>(parity_and_chain) & 1) != 0,
        .chain_id = parity_and_chain >> 1,
    };
}

}  // namespace custos
