// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <intx/intx.hpp>

#include <custos/core/common/bytes.hpp>

namespace custos::test_util {

//! Minimal big-endian bytes of an INTEGER value, with the 0x00 sign pad when the top bit is set
Bytes der_integer_content(const intx::uint256& value);

//! DER encoding of SEQUENCE { r INTEGER, s INTEGER } using short-form lengths, as cloud KMS services emit it
Bytes encode_der_signature(const intx::uint256& r, const intx::uint256& s);

//! Same as above but with every length (SEQUENCE and both INTEGERs) in long form with len_of_len bytes
Bytes encode_der_signature_long_form(const intx::uint256& r, const intx::uint256& s, uint8_t len_of_len = 1);

}  // namespace custos::test_util
