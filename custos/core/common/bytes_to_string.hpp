// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The only place where char and uint8_t buffers are reinterpreted into each other

#include <string>
#include <string_view>

#include <custos/core/common/bytes.hpp>

namespace custos {

inline const char* byte_ptr_cast(const uint8_t* ptr) { return reinterpret_cast<const char*>(ptr); }
inline const uint8_t* byte_ptr_cast(const char* ptr) { return reinterpret_cast<const uint8_t*>(ptr); }

inline ByteView string_view_to_byte_view(std::string_view text) { return {byte_ptr_cast(text.data()), text.size()}; }

inline std::string_view byte_view_to_string_view(ByteView bytes) { return {byte_ptr_cast(bytes.data()), bytes.size()}; }

inline Bytes string_to_bytes(std::string_view text) { return Bytes(byte_ptr_cast(text.data()), text.size()); }

}  // namespace custos
