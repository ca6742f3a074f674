// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "signature_exception.hpp"

#include <custos/core/types/address.hpp>

namespace custos {

MalformedSignatureException::MalformedSignatureException(DerError err)
    : SignatureException{std::string{der_error_message(err)}}, err_{err} {}

RecoveryFailureException::RecoveryFailureException(std::string_view expected, const evmc::address& recovered_at_27,
                                                   const evmc::address& recovered_at_28)
    : SignatureException{"Recovery failed: expected " + std::string{expected} +
                         ", recovered " + address_to_hex(recovered_at_27) + " with v=27 and " +
                         address_to_hex(recovered_at_28) + " with v=28"},
      expected_{expected},
      recovered_at_27_{recovered_at_27},
      recovered_at_28_{recovered_at_28} {}

SignatureRecoveryException::SignatureRecoveryException(uint8_t v)
    : SignatureException{"Signature recovery failed with v=" + std::to_string(v)}, v_{v} {}

}  // namespace custos
