// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>

#include <custos/core/common/util.hpp>

namespace custos::cmd::common {

HexValidator::HexValidator(std::optional<size_t> expected_size) {
    name_ = "HEX";
    func_ = [expected_size](const std::string& value) -> std::string {
        const auto bytes{from_hex(value)};
        if (!bytes) {
            return "Value " + value + " is not a valid hex string";
        }
        if (expected_size && bytes->size() != *expected_size) {
            return "Value " + value + " must be " + std::to_string(*expected_size) + " bytes long";
        }
        return {};
    };
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_hex(CLI::App& cli, const std::string& name, std::string& value, const std::string& description,
                    std::optional<size_t> expected_size) {
    cli.add_option(name, value, description)
        ->required()
        ->check(HexValidator{expected_size});
}

}  // namespace custos::cmd::common
