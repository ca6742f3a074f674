// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <evmc/evmc.hpp>

#include <custos/core/common/bytes.hpp>
#include <custos/core/signature/normalizer.hpp>

namespace custos::cmd {

//! Prints r, s, v and the 65-byte serialized form, one per line
void print_signature(const NormalizedSignature& signature, std::ostream& out);

//! Body of custos_normalize: normalizes der and prints it to out
//! \return 0 on success, -1 once the failure has been logged
int normalize(ByteView der, const evmc::bytes32& digest, const evmc::address& address, std::ostream& out);

}  // namespace custos::cmd
