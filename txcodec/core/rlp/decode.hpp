// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// RLP decoding functions as per
// https://eth.wiki/en/fundamentals/rlp

#pragma once

#include <txcodec/core/common/base.hpp>
#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/rlp/encode.hpp>

namespace txcodec::rlp {

// Whether to allow or prohibit trailing characters in an input after decoding.
// If prohibited and the input does contain extra characters, decoding returns DecodingError::kInputTooLong.
enum class Leftover {
    kProhibit,
    kAllow,
};

// Consumes an RLP header unless it's a single byte in the [0x00, 0x7f] range,
// in which case the byte is put back.
tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept;

}  // namespace txcodec::rlp
