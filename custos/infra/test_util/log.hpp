// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <custos/infra/common/log.hpp>

namespace custos::test_util {

//! Collects console log output in memory at the given verbosity.
//! Stream buffers and verbosity are restored on destruction.
class LogCapture {
  public:
    explicit LogCapture(log::Level level)
        : previous_level_{log::get_verbosity()},
          cout_buffer_{std::cout.rdbuf(captured_.rdbuf())},
          cerr_buffer_{std::cerr.rdbuf(captured_.rdbuf())} {
        log::set_verbosity(level);
    }
    ~LogCapture() {
        std::cout.rdbuf(cout_buffer_);
        std::cerr.rdbuf(cerr_buffer_);
        log::set_verbosity(previous_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string text() const { return captured_.str(); }

  private:
    std::ostringstream captured_;
    log::Level previous_level_;
    std::streambuf* cout_buffer_;
    std::streambuf* cerr_buffer_;
};

}  // namespace custos::test_util
