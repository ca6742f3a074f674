// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <unistd.h>

namespace custos {

bool is_terminal(std::FILE* stream) {
    return stream != nullptr && isatty(fileno(stream)) == 1;
}

}  // namespace custos
