// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

#include <custos/core/common/assert.hpp>
#include <custos/core/common/base.hpp>
#include <custos/core/common/util.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/infra/cli/common.hpp>
#include <custos/infra/common/log.hpp>

#include "normalize.hpp"

using namespace custos;
using namespace custos::cmd::common;

int main(int argc, char* argv[]) {
    CLI::App app{"Normalize a DER encoded KMS signature into (r, s, v)"};

    std::string der_hex, digest_hex, address_hex;
    add_option_hex(app, "--der", der_hex, "DER encoded ECDSA signature as hex");
    add_option_hex(app, "--digest", digest_hex, "Signed 32-byte digest as hex", kHashLength);
    add_option_hex(app, "--address", address_hex, "Address of the signing key", kAddressLength);

    log::Settings log_settings{};
    add_logging_options(app, log_settings);

    CLI11_PARSE(app, argc, argv)

    try {
        log::init(log_settings);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        return -1;
    }

    // Validated by HexValidator
    const auto der{from_hex(der_hex)};
    const auto digest{hex_to_bytes32(digest_hex)};
    const auto address{hex_to_address(address_hex)};
    CUSTOS_ASSERT(der && digest && address);

    return cmd::normalize(*der, *digest, *address, std::cout);
}
