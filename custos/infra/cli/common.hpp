// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <custos/infra/common/log.hpp>

namespace custos::cmd::common {

//! CLI11 validator for hex strings with optional 0x prefix
//! \param expected_size : exact number of bytes required, if any
struct HexValidator : public CLI::Validator {
    explicit HexValidator(std::optional<size_t> expected_size = std::nullopt);
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up a required option carrying a hex value, optionally of fixed byte size
void add_option_hex(CLI::App& cli, const std::string& name, std::string& value, const std::string& description,
                    std::optional<size_t> expected_size = std::nullopt);

}  // namespace custos::cmd::common
