// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "signature.hpp"

namespace txcodec::crypto {

tl::expected<SignatureTriplet, DecodingError> unmarshal_signature(ByteView signature) noexcept {
    if (signature.size() != kSignatureLength) {
        return tl::unexpected{DecodingError::kSignatureUnmarshalFailure};
    }
    SignatureTriplet triplet;
    triplet.r = intx::be::unsafe::load<intx::uint256>(signature.data());
    triplet.s = intx::be::unsafe::load<intx::uint256>(signature.data() + kHashLength);
    triplet.v = signature[2 * kHashLength];
    return triplet;
}

Bytes marshal_signature(const intx::uint256& r, const intx::uint256& s, uint8_t v) {
    Bytes signature(kSignatureLength, '\0');
    intx::be::unsafe::store(signature.data(), r);
    intx::be::unsafe::store(signature.data() + kHashLength, s);
    signature[2 * kHashLength] = v;
    return signature;
}

}  // namespace txcodec::crypto
