// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "eip712_envelope.hpp"

#include <catch2/catch_test_macros.hpp>

#include <txcodec/core/common/util.hpp>
#include <txcodec/infra/common/decoding_exception.hpp>
#include <txcodec/infra/test_util/log.hpp>

namespace txcodec::rpc {

using namespace evmc::literals;

static constexpr evmc::address kDestination{0x0000000000000000000000000000000000008006_address};

static nlohmann::json sample_json() {
    return R"({
        "to":"0x0000000000000000000000000000000000008006",
        "nonce":"0x1",
        "value":"0x0",
        "chainId":"0x10e",
        "data":"0x",
        "gas":"0x5208",
        "maxPriorityFeePerGas":"0x5f5e100",
        "maxFeePerGas":"0xee6b280",
        "v":"0x1b",
        "r":"0x1",
        "s":"0x2"
    })"_json;
}

TEST_CASE("decode envelope from transaction request", "[rpc][json][eip712]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    const auto envelope{decode_envelope_json(sample_json())};
    REQUIRE(envelope);
    CHECK(envelope->nonce == 1);
    CHECK(envelope->chain_id == intx::uint256{270});
    CHECK(envelope->to == kDestination);
    CHECK(envelope->gas_limit == 21'000);
    CHECK(envelope->max_priority_fee_per_gas == 100'000'000);
    CHECK(envelope->max_fee_per_gas == 250'000'000);
    CHECK(envelope->gas_price == 0);
    CHECK(envelope->v == 27);
    CHECK(envelope->r == 1);
    CHECK(envelope->s == 2);
    CHECK(envelope->access_list.empty());
    CHECK(!envelope->from);
    CHECK(!envelope->meta);

    Bytes encoded;
    rlp::encode(encoded, *envelope);
    CHECK(to_hex(encoded) ==
          "71f874018405f5e100840ee6b280825208940000000000000000000000000000000000008006808082010e808082010e8080c0b841"
          "0000000000000000000000000000000000000000000000000000000000000001"
          "0000000000000000000000000000000000000000000000000000000000000002"
          "1bc0");
}

TEST_CASE("decode envelope requires the request keys", "[rpc][json][eip712]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    for (const char* key : {"to", "nonce", "value", "chainId", "data", "v", "r", "s"}) {
        nlohmann::json j = sample_json();
        j.erase(key);
        CHECK(decode_envelope_json(j).error() == DecodingError::kMissingField);
    }

    SECTION("input replaces data") {
        nlohmann::json j = sample_json();
        j.erase("data");
        j["input"] = "0xabcd";
        const auto envelope{decode_envelope_json(j)};
        REQUIRE(envelope);
        CHECK(envelope->data == *from_hex("abcd"));
    }
    SECTION("input wins over data") {
        nlohmann::json j = sample_json();
        j["data"] = "0x01";
        j["input"] = "0x02";
        const auto envelope{decode_envelope_json(j)};
        REQUIRE(envelope);
        CHECK(envelope->data == *from_hex("02"));
    }
    SECTION("null required quantity") {
        nlohmann::json j = sample_json();
        j["nonce"] = nullptr;
        CHECK(decode_envelope_json(j).error() == DecodingError::kMissingField);
    }
    SECTION("not an object") {
        CHECK(decode_envelope_json(R"(["0x71"])"_json).error() == DecodingError::kUnexpectedVariantShape);
    }
    SECTION("v is a single byte") {
        nlohmann::json j = sample_json();
        j["v"] = "0xff";
        const auto envelope{decode_envelope_json(j)};
        REQUIRE(envelope);
        CHECK(envelope->v == 0xff);

        j["v"] = "0x100";
        CHECK(decode_envelope_json(j).error() == DecodingError::kOverflow);
    }
}

TEST_CASE("decode envelope destination", "[rpc][json][eip712]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    nlohmann::json j = sample_json();

    for (const nlohmann::json& to : {nlohmann::json(nullptr), nlohmann::json("0x"), nlohmann::json("0x0")}) {
        j["to"] = to;
        const auto envelope{decode_envelope_json(j)};
        REQUIRE(envelope);
        CHECK(envelope->to == kContractDeploymentAddress);
    }

    j["to"] = "0x1234";
    CHECK(decode_envelope_json(j).error() == DecodingError::kMalformedAddress);
    j["to"] = "0xzz00000000000000000000000000000000008006";
    CHECK(decode_envelope_json(j).error() == DecodingError::kMalformedAddress);
    j["to"] = 32774;
    CHECK(decode_envelope_json(j).error() == DecodingError::kMalformedAddress);
}

TEST_CASE("decode envelope optional quantities", "[rpc][json][eip712]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    SECTION("absent fee fields default to zero") {
        nlohmann::json j = sample_json();
        j.erase("maxFeePerGas");
        j.erase("maxPriorityFeePerGas");
        j.erase("gas");
        const auto envelope{decode_envelope_json(j)};
        REQUIRE(envelope);
        CHECK(envelope->max_fee_per_gas == 0);
        CHECK(envelope->max_priority_fee_per_gas == 0);
        CHECK(envelope->gas_limit == 0);
    }
    SECTION("malformed fee field") {
        nlohmann::json j = sample_json();
        j["maxFeePerGas"] = "not-hex";
        CHECK(decode_envelope_json(j).error() == DecodingError::kMalformedHex);
    }
    SECTION("gas is preferred over gasLimit") {
        nlohmann::json j = sample_json();
        j["gasLimit"] = "0x1";
        auto envelope{decode_envelope_json(j)};
        REQUIRE(envelope);
        CHECK(envelope->gas_limit == 21'000);

        j.erase("gas");
        envelope = decode_envelope_json(j);
        REQUIRE(envelope);
        CHECK(envelope->gas_limit == 1);

        j["gas"] = "0xzz";
        CHECK(decode_envelope_json(j).error() == DecodingError::kMalformedHex);
    }
    SECTION("gas price") {
        nlohmann::json j = sample_json();
        j["gasPrice"] = "0x3b9aca00";
        const auto envelope{decode_envelope_json(j)};
        REQUIRE(envelope);
        CHECK(envelope->gas_price == 1'000'000'000);
    }
}

TEST_CASE("decode envelope access list", "[rpc][json][eip712]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    nlohmann::json j = sample_json();

    j["accessList"] = R"([{"address":"0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed","storageKeys":[]}])"_json;
    auto envelope{decode_envelope_json(j)};
    REQUIRE(envelope);
    REQUIRE(envelope->access_list.size() == 1);
    CHECK(envelope->access_list[0].account == 0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed_address);

    // malformed access lists are dropped
    j["accessList"] = "0x01";
    envelope = decode_envelope_json(j);
    REQUIRE(envelope);
    CHECK(envelope->access_list.empty());
}

TEST_CASE("decode envelope sender and metadata", "[rpc][json][eip712]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    nlohmann::json j = sample_json();
    j["from"] = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    j["eip712Meta"] = R"({"gasPerPubdata":"0xc350","factoryDeps":["0xdead"]})"_json;

    const auto envelope{decode_envelope_json(j)};
    REQUIRE(envelope);
    CHECK(envelope->from == 0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed_address);
    REQUIRE(envelope->meta);
    CHECK(envelope->meta->gas_per_pubdata == intx::uint256{50000});
    CHECK(envelope->meta->factory_deps == std::vector<Bytes>{*from_hex("dead")});

    j["from"] = "0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    CHECK(decode_envelope_json(j).error() == DecodingError::kMalformedAddress);

    j["from"] = "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed";
    j["eip712Meta"] = R"({"customSignature":"0x1"})"_json;
    CHECK(decode_envelope_json(j).error() == DecodingError::kMalformedHex);
}

TEST_CASE("serialize envelope", "[rpc][json][eip712]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const Eip712Envelope envelope{*decode_envelope_json(sample_json())};

    nlohmann::json j = envelope;
    CHECK(j == R"({
        "type":"0x71",
        "nonce":"0x1",
        "chainId":"0x10e",
        "to":"0x0000000000000000000000000000000000008006",
        "value":"0x0",
        "data":"0x",
        "gas":"0x5208",
        "maxPriorityFeePerGas":"0x5f5e100",
        "maxFeePerGas":"0xee6b280",
        "gasPrice":"0x0",
        "accessList":[],
        "v":"0x1b",
        "r":"0x1",
        "s":"0x2"
    })"_json);
    CHECK(j.get<Eip712Envelope>() == envelope);

    Eip712Envelope with_meta{envelope};
    with_meta.from = 0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed_address;
    with_meta.meta = Eip712Meta{.gas_per_pubdata = 50000, .custom_signature = *from_hex("abcdef")};
    with_meta.access_list = {AccessListEntry{0x8a91dc2d28b689474298d91899f0c1baf62cb85b_address, {}}};
    nlohmann::json j2 = with_meta;
    CHECK(j2["from"] == "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
    CHECK(j2["eip712Meta"] == R"({"gasPerPubdata":"0xc350","customSignature":"0xabcdef"})"_json);
    CHECK(j2.get<Eip712Envelope>() == with_meta);
}

TEST_CASE("deserialize envelope throws", "[rpc][json][eip712]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    nlohmann::json j = sample_json();
    j.erase("v");
    try {
        [[maybe_unused]] const auto envelope = j.get<Eip712Envelope>();
        FAIL("expected DecodingException");
    } catch (const DecodingException& e) {
        CHECK(e.err() == DecodingError::kMissingField);
    }
}

}  // namespace txcodec::rpc
