// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace txcodec {

// Error codes for RLP, hex and envelope decoding
enum class [[nodiscard]] DecodingError {
    kOverflow,
    kLeadingZero,
    kInputTooShort,
    kInputTooLong,
    kNonCanonicalSize,
    kUnexpectedLength,
    kUnexpectedString,
    kUnexpectedList,
    kUnexpectedListElements,
    kMissingField,               // required JSON key absent
    kMalformedHex,               // non-hex characters or odd-length byte string
    kMalformedAddress,           // wrong byte length or bad EIP-55 checksum
    kUnexpectedVariantShape,     // list where a scalar is expected or vice versa
    kWrongTypeDiscriminant,      // EIP-2718 type byte mismatch
    kFieldCountMismatch,         // envelope list length differs from the layout
    kSignatureUnmarshalFailure,  // custom signature is not r || s || v
};

// TODO(C++23) Switch to std::expected
using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace txcodec
