/*
   Copyright 2022 The Silkworm Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "decode.hpp"

#include <string>

#include <catch2/catch_test_macros.hpp>

#include <txcodec/core/common/util.hpp>

namespace txcodec::rlp {

// Decodes the header of hex input and reports how many bytes the header consumed
static Header decode_header_success(std::string_view hex, size_t expected_consumed) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    const auto h{decode_header(view)};
    REQUIRE(h);
    CHECK(bytes.size() - view.size() == expected_consumed);
    return *h;
}

static DecodingError decode_header_failure(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    const auto h{decode_header(view)};
    REQUIRE(!h);
    return h.error();
}

TEST_CASE("RLP header decoding") {
    SECTION("single byte") {
        const Header h{decode_header_success("00", 0)};
        CHECK(!h.list);
        CHECK(h.payload_length == 1);
        CHECK(decode_header_success("7f", 0).payload_length == 1);
    }

    SECTION("short strings") {
        const Header empty{decode_header_success("80", 1)};
        CHECK(!empty.list);
        CHECK(empty.payload_length == 0);

        const Header h{decode_header_success("8D6F62636465666768696A6B6C6D", 1)};
        CHECK(!h.list);
        CHECK(h.payload_length == 13);

        CHECK(decode_header_success("8180", 1).payload_length == 1);
    }

    SECTION("long strings") {
        const std::string payload(56 * 2, 'a');
        const Header h{decode_header_success("B838" + payload, 2)};
        CHECK(!h.list);
        CHECK(h.payload_length == 56);
    }

    SECTION("short lists") {
        const Header empty{decode_header_success("C0", 1)};
        CHECK(empty.list);
        CHECK(empty.payload_length == 0);

        const Header h{decode_header_success("C3010203", 1)};
        CHECK(h.list);
        CHECK(h.payload_length == 3);
    }

    SECTION("long lists") {
        const std::string payload(60 * 2, '0');
        const Header h{decode_header_success("F83C" + payload, 2)};
        CHECK(h.list);
        CHECK(h.payload_length == 60);
    }

    SECTION("non-canonical sizes") {
        CHECK(decode_header_failure("8105") == DecodingError::kNonCanonicalSize);
        CHECK(decode_header_failure("B8020004") == DecodingError::kNonCanonicalSize);
        CHECK(decode_header_failure("F80100") == DecodingError::kNonCanonicalSize);
        CHECK(decode_header_failure("B90038" + std::string(56 * 2, '0')) == DecodingError::kLeadingZero);
    }

    SECTION("truncated input") {
        CHECK(decode_header_failure("") == DecodingError::kInputTooShort);
        CHECK(decode_header_failure("81") == DecodingError::kInputTooShort);
        CHECK(decode_header_failure("83AABB") == DecodingError::kInputTooShort);
        CHECK(decode_header_failure("B8") == DecodingError::kInputTooShort);
        CHECK(decode_header_failure("F9FF") == DecodingError::kInputTooShort);
        CHECK(decode_header_failure("BFFFFFFFFFFFFFFFFF") == DecodingError::kInputTooShort);
        CHECK(decode_header_failure("C2AA") == DecodingError::kInputTooShort);
    }
}

}  // namespace txcodec::rlp
