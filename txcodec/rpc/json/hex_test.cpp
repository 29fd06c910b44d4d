// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "hex.hpp"

#include <catch2/catch_test_macros.hpp>

namespace txcodec::rpc {

TEST_CASE("find_field", "[rpc][json][hex]") {
    const auto j = R"({"a":"0x1","b":null})"_json;
    REQUIRE(find_field(j, "a"));
    CHECK(*find_field(j, "a") == "0x1");
    CHECK(find_field(j, "b") == nullptr);
    CHECK(find_field(j, "c") == nullptr);
    CHECK(find_field(R"(["a"])"_json, "a") == nullptr);
}

TEST_CASE("required quantity", "[rpc][json][hex]") {
    const auto j = R"({"nonce":"0x1f","odd":"0x1","bad":"not-hex","empty":"0x","number":31,"null":null,"big":"0x10000000000000000"})"_json;

    CHECK(required_quantity<uint64_t>(j, "nonce") == 0x1f);
    CHECK(required_quantity<uint64_t>(j, "odd") == 1);
    CHECK(required_quantity<intx::uint256>(j, "big") == intx::uint256{1} << 64);

    CHECK(required_quantity<uint64_t>(j, "missing").error() == DecodingError::kMissingField);
    CHECK(required_quantity<uint64_t>(j, "null").error() == DecodingError::kMissingField);
    CHECK(required_quantity<uint64_t>(j, "bad").error() == DecodingError::kMalformedHex);
    CHECK(required_quantity<uint64_t>(j, "empty").error() == DecodingError::kMalformedHex);
    CHECK(required_quantity<uint64_t>(j, "number").error() == DecodingError::kMalformedHex);
    CHECK(required_quantity<uint64_t>(j, "big").error() == DecodingError::kOverflow);
}

TEST_CASE("quantity with default", "[rpc][json][hex]") {
    const auto j = R"({"maxFeePerGas":"0xEE6B280","bad":"not-hex","null":null})"_json;

    CHECK(quantity_or<uint64_t>(j, "maxFeePerGas", 0) == 0xee6b280);
    CHECK(quantity_or<uint64_t>(j, "maxPriorityFeePerGas", 0) == 0);
    CHECK(quantity_or<uint64_t>(j, "null", 7) == 7);
    CHECK(quantity_or<uint64_t>(j, "bad", 0).error() == DecodingError::kMalformedHex);
}

TEST_CASE("optional quantity", "[rpc][json][hex]") {
    const auto j = R"({"gasPerPubdata":"0xc350","bad":"0xg"})"_json;

    const auto present{optional_quantity<intx::uint256>(j, "gasPerPubdata")};
    REQUIRE(present);
    CHECK(*present == intx::uint256{50000});

    const auto absent{optional_quantity<intx::uint256>(j, "missing")};
    REQUIRE(absent);
    CHECK(!absent->has_value());

    CHECK(optional_quantity<intx::uint256>(j, "bad").error() == DecodingError::kMalformedHex);
}

TEST_CASE("hex bytes", "[rpc][json][hex]") {
    const auto j = R"({"data":"0xDEADbeef","empty":"0x","odd":"0xabc","bad":"0xzz","plain":"0102"})"_json;

    CHECK(required_bytes(j, "data") == *from_hex("deadbeef"));
    CHECK(required_bytes(j, "empty") == Bytes{});
    CHECK(required_bytes(j, "plain") == *from_hex("0102"));
    CHECK(required_bytes(j, "odd").error() == DecodingError::kMalformedHex);
    CHECK(required_bytes(j, "bad").error() == DecodingError::kMalformedHex);
    CHECK(required_bytes(j, "missing").error() == DecodingError::kMissingField);

    CHECK(bytes_or(j, "missing", *from_hex("01")) == *from_hex("01"));
    CHECK(bytes_or(j, "odd", Bytes{}).error() == DecodingError::kMalformedHex);

    const auto absent{optional_bytes(j, "missing")};
    REQUIRE(absent);
    CHECK(!absent->has_value());
    CHECK(decode_hex_bytes(nlohmann::json(42)).error() == DecodingError::kMalformedHex);
}

}  // namespace txcodec::rpc
