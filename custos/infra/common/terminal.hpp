// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <string_view>

namespace custos {

// ANSI escape sequences of the console log
inline constexpr std::string_view kColorReset{"\x1b[0m"};
inline constexpr std::string_view kColorCoal{"\x1b[90m"};
inline constexpr std::string_view kColorWhite{"\x1b[97m"};
inline constexpr std::string_view kColorRed{"\x1b[91m"};
inline constexpr std::string_view kColorGreen{"\x1b[32m"};
inline constexpr std::string_view kColorOrangeHigh{"\x1b[1;33m"};
inline constexpr std::string_view kBackgroundRed{"\x1b[101m"};
inline constexpr std::string_view kBackgroundPurple{"\x1b[105m"};

//! Whether stream writes to a TTY
bool is_terminal(std::FILE* stream);

}  // namespace custos
