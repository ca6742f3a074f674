// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace custos {

//! Throws std::logic_error with message unless condition holds
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

//! As ensure, for states the code itself must never reach
inline void ensure_invariant(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{"Invariant violation: " + std::string{message}};
    }
}

//! Throws std::invalid_argument for bad input from the caller; the message is only built on failure
template <class MessageBuilder>
inline void ensure_pre_condition(bool condition, MessageBuilder&& build_message) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument{"Pre-condition violation: " + std::forward<MessageBuilder>(build_message)()};
    }
}

}  // namespace custos
