// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>

#include <intx/intx.hpp>

namespace custos {

//! v of a serialized signature is the recovery id plus this offset
inline constexpr uint8_t kRecoveryIdOffset{27};

struct YParityAndChainId {
    bool odd{false};
    //! Only for EIP-155 values
    std::optional<intx::uint256> chain_id;
};

//! \brief Reads the y parity out of a v value as signers report it.
//! \return std::nullopt unless v is a recovery id (0, 1), a legacy value (27, 28)
//! or an EIP-155 value (chain_id * 2 + 35 + parity)
std::optional<YParityAndChainId> v_to_y_parity_and_chain_id(const intx::uint256& v) noexcept;

}  // namespace custos
