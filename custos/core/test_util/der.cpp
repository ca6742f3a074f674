// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "der.hpp"

#include <custos/core/common/util.hpp>
#include <custos/core/crypto/der.hpp>
#include <custos/core/types/evmc_bytes32.hpp>

namespace custos::test_util {

Bytes der_integer_content(const intx::uint256& value) {
    const evmc::bytes32 word{to_bytes32(value)};
    Bytes content{zeroless_view(ByteView{word.bytes})};
    if (content.empty()) {
        content.push_back(0x00);
    }
    if (content[0] & 0x80) {
        content.insert(content.begin(), 0x00);
    }
    return content;
}

static void append_length(Bytes& out, size_t length, uint8_t len_of_len) {
    if (len_of_len == 0) {
        out.push_back(static_cast<uint8_t>(length));
        return;
    }
    out.push_back(static_cast<uint8_t>(0x80 | len_of_len));
    for (int i{len_of_len - 1}; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(i < static_cast<int>(sizeof(size_t)) ? (length >> (8 * i)) & 0xff : 0));
    }
}

static Bytes encode(const intx::uint256& r, const intx::uint256& s, uint8_t len_of_len) {
    Bytes body;
    for (const auto& value : {r, s}) {
        const Bytes content{der_integer_content(value)};
        body.push_back(kDerIntegerTag);
        append_length(body, content.size(), len_of_len);
        body += content;
    }
    Bytes out{kDerSequenceTag};
    append_length(out, body.size(), len_of_len);
    out += body;
    return out;
}

Bytes encode_der_signature(const intx::uint256& r, const intx::uint256& s) {
    return encode(r, s, 0);
}

Bytes encode_der_signature_long_form(const intx::uint256& r, const intx::uint256& s, uint8_t len_of_len) {
    return encode(r, s, len_of_len);
}

}  // namespace custos::test_util
