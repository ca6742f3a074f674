// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "der.hpp"

#include <cstring>
#include <limits>

#include <custos/core/common/base.hpp>
#include <custos/core/common/util.hpp>

namespace custos {

std::string_view der_error_message(DerError err) noexcept {
    switch (err) {
        case DerError::kMissingSequence:
            return "Invalid DER: Missing Sequence";
        case DerError::kUnexpectedEnd:
            return "Invalid DER: Unexpected end of data";
        case DerError::kLengthOutOfBounds:
            return "Invalid DER: Length out of bounds";
        case DerError::kMissingInteger:
            return "Invalid DER: Missing Integer";
        case DerError::kIntegerOutOfBounds:
            return "Invalid DER: Integer out of bounds";
        case DerError::kEmptyInteger:
            return "Invalid DER: Empty Integer";
        case DerError::kIntegerOverflow:
            return "Invalid DER: Integer exceeds 256 bits";
        case DerError::kScalarOutOfRange:
            return "Invalid signature: r or s out of range";
    }
    return "Invalid DER";
}

namespace {

    //! Forward-only reader over the encoded signature; every read is bounds checked
    class DerCursor {
      public:
        explicit DerCursor(ByteView data) noexcept : data_{data} {}

        tl::expected<uint8_t, DerError> read_byte() noexcept {
            if (offset_ >= data_.size()) {
                return tl::unexpected{DerError::kUnexpectedEnd};
            }
            return data_[offset_++];
        }

        // Long-form SEQUENCE length: skip the length bytes without decoding them
        tl::expected<void, DerError> skip_sequence_length() noexcept {
            const auto length_byte{read_byte()};
            if (!length_byte) {
                return tl::unexpected{length_byte.error()};
            }
            if (*length_byte & 0x80) {
                const size_t len_of_len{*length_byte & 0x7fu};
                if (len_of_len > data_.size() - offset_) {
                    return tl::unexpected{DerError::kLengthOutOfBounds};
                }
                offset_ += len_of_len;
            }
            return {};
        }

        tl::expected<size_t, DerError> read_length() noexcept {
            const auto length_byte{read_byte()};
            if (!length_byte) {
                return tl::unexpected{length_byte.error()};
            }
            if (!(*length_byte & 0x80)) {
                return *length_byte;
            }
            const size_t len_of_len{*length_byte & 0x7fu};
            // Saturate instead of wrapping: any such length fails the content bounds check anyway
            static constexpr size_t kSaturated{std::numeric_limits<size_t>::max()};
            size_t length{0};
            for (size_t i{0}; i < len_of_len; ++i) {
                const auto b{read_byte()};
                if (!b) {
                    return tl::unexpected{b.error()};
                }
                length = length > (kSaturated >> 8) ? kSaturated : (length << 8) | *b;
            }
            return length;
        }

        tl::expected<ByteView, DerError> read_content(size_t length) noexcept {
            if (length > data_.size() - offset_) {
                return tl::unexpected{DerError::kIntegerOutOfBounds};
            }
            ByteView content{data_.substr(offset_, length)};
            offset_ += length;
            return content;
        }

      private:
        ByteView data_;
        size_t offset_{0};
    };

    tl::expected<intx::uint256, DerError> read_integer(DerCursor& cursor) noexcept {
        const auto tag{cursor.read_byte()};
        if (!tag) {
            return tl::unexpected{tag.error()};
        }
        if (*tag != kDerIntegerTag) {
            return tl::unexpected{DerError::kMissingInteger};
        }
        const auto length{cursor.read_length()};
        if (!length) {
            return tl::unexpected{length.error()};
        }
        const auto content{cursor.read_content(*length)};
        if (!content) {
            return tl::unexpected{content.error()};
        }
        if (content->empty()) {
            return tl::unexpected{DerError::kEmptyInteger};
        }

        // The 0x00 sign pad (and any other leading zero) carries no value
        const ByteView magnitude{zeroless_view(*content)};
        if (magnitude.size() > kHashLength) {
            return tl::unexpected{DerError::kIntegerOverflow};
        }
        uint8_t word[kHashLength]{};
        if (!magnitude.empty()) {
            std::memcpy(word + kHashLength - magnitude.size(), magnitude.data(), magnitude.size());
        }
        return intx::be::load<intx::uint256>(word);
    }

}  // namespace

DerDecodingResult decode_der_signature(ByteView der) noexcept {
    DerCursor cursor{der};

    const auto tag{cursor.read_byte()};
    if (!tag) {
        return tl::unexpected{tag.error()};
    }
    if (*tag != kDerSequenceTag) {
        return tl::unexpected{DerError::kMissingSequence};
    }
    if (const auto res{cursor.skip_sequence_length()}; !res) {
        return tl::unexpected{res.error()};
    }

    DerSignature signature;
    const auto r{read_integer(cursor)};
    if (!r) {
        return tl::unexpected{r.error()};
    }
    signature.r = *r;

    const auto s{read_integer(cursor)};
    if (!s) {
        return tl::unexpected{s.error()};
    }
    signature.s = *s;

    return signature;
}

}  // namespace custos
