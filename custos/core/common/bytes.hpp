// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

#include <evmc/bytes.hpp>

namespace custos {

//! Owned byte string
using Bytes = evmc::bytes;

//! Non-owning view over bytes. Implicit from Bytes and from fixed-size arrays
//! such as evmc::bytes32::bytes, never from a bare pointer.
class ByteView : public evmc::bytes_view {
  public:
    constexpr ByteView() noexcept = default;

    constexpr ByteView(const uint8_t* data, size_t size) noexcept : evmc::bytes_view{data, size} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr ByteView(evmc::bytes_view view) noexcept : evmc::bytes_view{view} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    ByteView(const Bytes& bytes) noexcept : evmc::bytes_view{bytes.data(), bytes.size()} {}

    template <size_t N>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : evmc::bytes_view{array, N} {}
};

}  // namespace custos
