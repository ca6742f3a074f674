// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Minimal DER decoding of ECDSA-Sig-Value, see RFC 3279 Section 2.2.3
//
//   Ecdsa-Sig-Value ::= SEQUENCE {
//       r INTEGER,
//       s INTEGER }

#include <string_view>

#include <intx/intx.hpp>
#include <tl/expected.hpp>

#include <custos/core/common/bytes.hpp>

namespace custos {

inline constexpr uint8_t kDerSequenceTag{0x30};
inline constexpr uint8_t kDerIntegerTag{0x02};

// Structural violations of a DER encoded ECDSA signature
enum class [[nodiscard]] DerError {
    kMissingSequence,
    kUnexpectedEnd,
    kLengthOutOfBounds,
    kMissingInteger,
    kIntegerOutOfBounds,
    kEmptyInteger,       // INTEGER with no content bytes
    kIntegerOverflow,    // INTEGER value wider than 256 bits
    kScalarOutOfRange,   // r or s not in [1, N)
};

std::string_view der_error_message(DerError err) noexcept;

struct DerSignature {
    intx::uint256 r;
    intx::uint256 s;

    friend bool operator==(const DerSignature&, const DerSignature&) = default;
};

using DerDecodingResult = tl::expected<DerSignature, DerError>;

//! \brief Decodes the r and s integers of a DER encoded ECDSA signature
//! \remarks The outer SEQUENCE length is skipped, not cross-checked against the content:
//! each INTEGER is bounds checked on its own. Trailing bytes after s are ignored.
//! A leading 0x00 sign pad on either integer carries no value.
DerDecodingResult decode_der_signature(ByteView der) noexcept;

}  // namespace custos
