// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "normalize.hpp"

#include <exception>
#include <string>

#include <magic_enum.hpp>

#include <custos/core/common/util.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/infra/common/log.hpp>

namespace custos::cmd {

void print_signature(const NormalizedSignature& signature, std::ostream& out) {
    out << "r: " << to_hex(signature.r, true) << "\n"
        << "s: " << to_hex(signature.s, true) << "\n"
        << "v: " << static_cast<int>(signature.v) << "\n"
        << "signature: " << to_hex(serialize_signature(signature), true) << "\n";
}

int normalize(ByteView der, const evmc::bytes32& digest, const evmc::address& address, std::ostream& out) {
    log::Info("Normalizing signature", {"der", abridge(to_hex(der, true), 24), "digest", to_hex(digest, true),
                                        "address", address_to_hex(address)});
    try {
        print_signature(normalize_signature(der, digest, address), out);
    } catch (const MalformedSignatureException& ex) {
        CUSTOS_ERROR << ex.what() << log::Args{"error", std::string{magic_enum::enum_name(ex.err())}};
        return -1;
    } catch (const std::exception& ex) {
        CUSTOS_ERROR << ex.what();
        return -1;
    }
    return 0;
}

}  // namespace custos::cmd
