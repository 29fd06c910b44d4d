// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <intx/intx.hpp>

#include <txcodec/core/common/base.hpp>
#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>

namespace txcodec::crypto {

//! \brief Components of a recoverable secp256k1 signature
struct SignatureTriplet {
    intx::uint256 r;
    intx::uint256 s;
    uint8_t v{0};

    friend bool operator==(const SignatureTriplet&, const SignatureTriplet&) = default;
};

//! \brief Splits the 65-byte r(32) || s(32) || v(1) form into its components
//! \return kSignatureUnmarshalFailure if the input is not exactly kSignatureLength bytes
tl::expected<SignatureTriplet, DecodingError> unmarshal_signature(ByteView signature) noexcept;

//! \brief Produces the 65-byte r || s || v form, r and s left-padded to 32 bytes
Bytes marshal_signature(const intx::uint256& r, const intx::uint256& s, uint8_t v);

}  // namespace txcodec::crypto
