// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <custos/core/crypto/der.hpp>

namespace custos {

//! Base of every failure raised while turning a DER signature into (r, s, v)
class SignatureException : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! The DER input could not be decoded, or its scalars are not in [1, N)
class MalformedSignatureException : public SignatureException {
  public:
    explicit MalformedSignatureException(DerError err);

    DerError err() const noexcept { return err_; }

  private:
    DerError err_;
};

//! Neither v = 27 nor v = 28 recovers the expected address
class RecoveryFailureException : public SignatureException {
  public:
    RecoveryFailureException(std::string_view expected, const evmc::address& recovered_at_27,
                             const evmc::address& recovered_at_28);

    const std::string& expected() const noexcept { return expected_; }
    const evmc::address& recovered_at_27() const noexcept { return recovered_at_27_; }
    const evmc::address& recovered_at_28() const noexcept { return recovered_at_28_; }

  private:
    std::string expected_;
    evmc::address recovered_at_27_;
    evmc::address recovered_at_28_;
};

//! The recovery primitive produced no address at all for the attempted v
class SignatureRecoveryException : public SignatureException {
  public:
    explicit SignatureRecoveryException(uint8_t v);

    uint8_t v() const noexcept { return v_; }

  private:
    uint8_t v_;
};

}  // namespace custos
