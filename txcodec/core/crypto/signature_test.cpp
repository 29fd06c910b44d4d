// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "signature.hpp"

#include <catch2/catch_test_macros.hpp>

#include <txcodec/core/common/util.hpp>

namespace txcodec::crypto {

TEST_CASE("Marshal signature") {
    const Bytes signature{marshal_signature(1, 2, 27)};
    REQUIRE(signature.size() == kSignatureLength);
    CHECK(to_hex(signature) ==
          "0000000000000000000000000000000000000000000000000000000000000001"
          "0000000000000000000000000000000000000000000000000000000000000002"
          "1b");

    CHECK(marshal_signature(0, 0, 0xff)[2 * kHashLength] == 0xff);
}

TEST_CASE("Unmarshal signature") {
    SECTION("well-formed") {
        const Bytes signature{*from_hex(
            "0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276"
            "67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83"
            "1c")};
        const auto triplet{unmarshal_signature(signature)};
        REQUIRE(triplet);
        CHECK(triplet->r == intx::from_string<intx::uint256>(
                                "0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276"));
        CHECK(triplet->s == intx::from_string<intx::uint256>(
                                "0x67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83"));
        CHECK(triplet->v == 0x1c);
        CHECK(marshal_signature(triplet->r, triplet->s, triplet->v) == signature);
    }

    SECTION("wrong length") {
        CHECK(unmarshal_signature({}).error() == DecodingError::kSignatureUnmarshalFailure);
        CHECK(unmarshal_signature(Bytes(kSignatureLength - 1, '\0')).error() ==
              DecodingError::kSignatureUnmarshalFailure);
        CHECK(unmarshal_signature(Bytes(kSignatureLength + 1, '\0')).error() ==
              DecodingError::kSignatureUnmarshalFailure);
    }
}

}  // namespace txcodec::crypto
