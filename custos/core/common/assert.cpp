// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <iostream>

namespace custos {

void fail_assertion(const char* expression, const char* file, int line) {
    std::cerr << "custos: assertion `" << expression << "` failed at " << file << ":" << line << std::endl;
    std::abort();
}

}  // namespace custos
