// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace custos {

//! Reports the failed expression on std::cerr and aborts
[[noreturn]] void fail_assertion(const char* expression, const char* file, int line);

}  // namespace custos

// Checked in every build type, NDEBUG included
#define CUSTOS_ASSERT(expr)   \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::custos::fail_assertion(#expr, __FILE__, __LINE__)
