// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <txcodec/core/common/endian.hpp>

namespace txcodec::rlp {

// Reads the big-endian payload length that follows a long-form prefix byte
static tl::expected<size_t, DecodingError> decode_long_length(ByteView& from, size_t len_of_len) noexcept {
    if (from.size() < len_of_len) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    uint64_t len{0};
    if (DecodingResult res{endian::from_big_compact(from.substr(0, len_of_len), len)}; !res) {
        return tl::unexpected{res.error()};
    }
    from.remove_prefix(len_of_len);
    if (len < 56) {
        return tl::unexpected{DecodingError::kNonCanonicalSize};
    }
    return static_cast<size_t>(len);
}

tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    Header h{.list = false};
    uint8_t b{from[0]};
    if (b < 0x80) {
        h.payload_length = 1;
    } else if (b < 0xB8) {
        from.remove_prefix(1);
        h.payload_length = b - 0x80u;
        if (h.payload_length == 1) {
            if (from.empty()) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            if (from[0] < 0x80) {
                return tl::unexpected{DecodingError::kNonCanonicalSize};
            }
        }
    } else if (b < 0xC0) {
        from.remove_prefix(1);
        const auto len{decode_long_length(from, b - 0xB7u)};
        if (!len) {
            return tl::unexpected{len.error()};
        }
        h.payload_length = *len;
    } else if (b < 0xF8) {
        from.remove_prefix(1);
        h.list = true;
        h.payload_length = b - 0xC0u;
    } else {
        from.remove_prefix(1);
        h.list = true;
        const auto len{decode_long_length(from, b - 0xF7u)};
        if (!len) {
            return tl::unexpected{len.error()};
        }
        h.payload_length = *len;
    }

    if (from.size() < h.payload_length) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    return h;
}

}  // namespace txcodec::rlp
