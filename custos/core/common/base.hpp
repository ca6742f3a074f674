// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic constants.

#include <cstddef>
#include <cstdint>

#include <custos/core/common/assert.hpp>

namespace custos {

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// Compact r || s, as libsecp256k1 serializes it
inline constexpr size_t kCompactSignatureLength{2 * kHashLength};

// r || s || v
inline constexpr size_t kSerializedSignatureLength{kCompactSignatureLength + 1};

inline constexpr size_t kPrivateKeyLength{32};

// 0x04 || X || Y
inline constexpr size_t kUncompressedPublicKeyLength{65};

}  // namespace custos
