// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "eip712_envelope.hpp"

#include <functional>

#include <catch2/catch_test_macros.hpp>

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/crypto/signature.hpp>
#include <txcodec/core/rlp/item.hpp>

namespace txcodec {

using namespace evmc::literals;

static constexpr evmc::address kPaymaster{0x0000000000000000000000000000000000008006_address};

static Eip712Envelope sample_envelope() {
    Eip712Envelope txn;
    txn.nonce = 1;
    txn.chain_id = 270;
    txn.to = 0x0000000000000000000000000000000000008006_address;
    txn.max_priority_fee_per_gas = 100'000'000;
    txn.max_fee_per_gas = 250'000'000;
    txn.gas_limit = 21'000;
    txn.v = 27;
    txn.r = 1;
    txn.s = 2;
    return txn;
}

static Bytes encode(const Eip712Envelope& txn) {
    Bytes encoded;
    rlp::encode(encoded, txn);
    return encoded;
}

// Re-encodes a broadcast envelope after altering its top-level RLP items
static Bytes alter_fields(const Bytes& encoded, const std::function<void(rlp::ItemList&)>& alter) {
    ByteView view{encoded};
    view.remove_prefix(1);
    auto item{rlp::decode_item(view)};
    REQUIRE(item);
    REQUIRE(item->is_list());
    rlp::ItemList fields{*item->list()};
    alter(fields);
    Bytes altered{kEip712TransactionType};
    rlp::encode(altered, rlp::Item{std::move(fields)});
    return altered;
}

static rlp::Item& field(rlp::ItemList& fields, Eip712BroadcastField f) {
    return fields[static_cast<size_t>(f)];
}

TEST_CASE("EIP-712 broadcast encoding") {
    const Eip712Envelope txn{sample_envelope()};
    const Bytes encoded{encode(txn)};
    CHECK(to_hex(encoded) ==
          "71f874018405f5e100840ee6b280825208940000000000000000000000000000000000008006808082010e808082010e8080c0b841"
          "0000000000000000000000000000000000000000000000000000000000000001"
          "0000000000000000000000000000000000000000000000000000000000000002"
          "1bc0");
    CHECK(rlp::length(txn) == encoded.size());

    // a custom signature replaces r || s || v on the wire
    Eip712Envelope custom{txn};
    custom.meta = Eip712Meta{.custom_signature = Bytes(kSignatureLength, 0xff)};
    CHECK(custom.wire_signature() == Bytes(kSignatureLength, 0xff));
    CHECK(rlp::length(custom) == encode(custom).size());
}

TEST_CASE("EIP-712 envelope round trip") {
    Eip712Envelope txn{sample_envelope()};
    txn.value = intx::from_string<intx::uint256>("1000000000000000000");
    txn.data = *from_hex("a9059cbb000000000000000000000000000000000000000000000000000000000000dead");
    txn.from = 0x36615cf349d7f6344891b1e7ca7c72883f5dc049_address;
    txn.gas_price = 5;
    txn.access_list = {{.account = kPaymaster, .storage_keys = {evmc::bytes32{1}}}};
    txn.meta = Eip712Meta{
        .gas_per_pubdata = 50'000,
        .paymaster_params = PaymasterParams{.paymaster = kPaymaster, .paymaster_input = *from_hex("8c5a3445")},
        .factory_deps = {*from_hex("dead"), *from_hex("beef")},
    };

    const auto decoded{decode_eip712_envelope(encode(txn))};
    REQUIRE(decoded);

    Eip712Envelope expected{txn};
    expected.access_list.clear();
    expected.gas_price = 0;
    expected.meta->custom_signature = crypto::marshal_signature(txn.r, txn.s, txn.v);
    CHECK(*decoded == expected);
    CHECK(decoded->hash() == txn.hash());

    // decoding again from the decoded value is stable
    const auto redecoded{decode_eip712_envelope(encode(*decoded))};
    REQUIRE(redecoded);
    CHECK(*redecoded == *decoded);
}

TEST_CASE("EIP-712 envelope without metadata") {
    const Eip712Envelope txn{sample_envelope()};
    const auto decoded{decode_eip712_envelope(encode(txn))};
    REQUIRE(decoded);
    CHECK(decoded->chain_id == 270);
    CHECK(!decoded->from);
    REQUIRE(decoded->meta);
    CHECK(decoded->meta->gas_per_pubdata == 0);
    CHECK(decoded->meta->factory_deps.empty());
    CHECK(!decoded->meta->paymaster_params);
    CHECK(decoded->meta->custom_signature == crypto::marshal_signature(1, 2, 27));
    CHECK(decoded->v == 27);
    CHECK(decoded->r == 1);
    CHECK(decoded->s == 2);
}

TEST_CASE("EIP-712 chain id is taken from the duplicate slot") {
    const Bytes encoded{*from_hex(
        "71f870018405f5e100840ee6b2808252089400000000000000000000000000000000000080068080018080028080c0b841"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000002"
        "1bc0")};
    const auto decoded{decode_eip712_envelope(encoded)};
    REQUIRE(decoded);
    CHECK(decoded->chain_id == 2);
}

TEST_CASE("EIP-712 decoding failures") {
    const Bytes encoded{encode(sample_envelope())};

    SECTION("type discriminant") {
        CHECK(decode_eip712_envelope({}).error() == DecodingError::kInputTooShort);

        Bytes wrong_type{encoded};
        wrong_type[0] = 0x02;
        CHECK(decode_eip712_envelope(wrong_type).error() == DecodingError::kWrongTypeDiscriminant);
        CHECK(decode_eip712_envelope(ByteView{encoded}.substr(1)).error() == DecodingError::kWrongTypeDiscriminant);
    }

    SECTION("field count") {
        const Bytes fifteen{alter_fields(encoded, [](rlp::ItemList& fields) { fields.pop_back(); })};
        CHECK(decode_eip712_envelope(fifteen).error() == DecodingError::kFieldCountMismatch);

        const Bytes seventeen{alter_fields(encoded, [](rlp::ItemList& fields) { fields.emplace_back(ByteView{}); })};
        CHECK(decode_eip712_envelope(seventeen).error() == DecodingError::kFieldCountMismatch);

        const Bytes empty_list{*from_hex("71c0")};
        CHECK(decode_eip712_envelope(empty_list).error() == DecodingError::kFieldCountMismatch);
    }

    SECTION("not a list") {
        const Bytes string{*from_hex("7182abcd")};
        CHECK(decode_eip712_envelope(string).error() == DecodingError::kUnexpectedString);
    }

    SECTION("trailing bytes") {
        Bytes trailing{encoded};
        trailing.push_back(0x80);
        CHECK(decode_eip712_envelope(trailing).error() == DecodingError::kInputTooLong);
    }

    SECTION("truncated") {
        CHECK(decode_eip712_envelope(ByteView{encoded}.substr(0, encoded.size() - 1)).error() ==
              DecodingError::kInputTooShort);
    }

    SECTION("list in an integer slot") {
        const Bytes altered{alter_fields(encoded, [](rlp::ItemList& fields) {
            field(fields, Eip712BroadcastField::kNonce) = rlp::Item{rlp::ItemList{}};
        })};
        CHECK(decode_eip712_envelope(altered).error() == DecodingError::kUnexpectedVariantShape);
    }

    SECTION("list in a reserved slot") {
        const Bytes altered{alter_fields(encoded, [](rlp::ItemList& fields) {
            field(fields, Eip712BroadcastField::kReserved2) = rlp::Item{rlp::ItemList{}};
        })};
        CHECK(decode_eip712_envelope(altered).error() == DecodingError::kUnexpectedVariantShape);
    }

    SECTION("signature of the wrong size") {
        static const Bytes kShortSignature(kSignatureLength - 1, 0x01);
        const Bytes altered{alter_fields(encoded, [](rlp::ItemList& fields) {
            field(fields, Eip712BroadcastField::kCustomSignature) = rlp::Item{ByteView{kShortSignature}};
        })};
        CHECK(decode_eip712_envelope(altered).error() == DecodingError::kSignatureUnmarshalFailure);
    }

    SECTION("malformed destination") {
        static const Bytes kShortAddress(kAddressLength - 1, 0x01);
        const Bytes altered{alter_fields(encoded, [](rlp::ItemList& fields) {
            field(fields, Eip712BroadcastField::kTo) = rlp::Item{ByteView{kShortAddress}};
        })};
        CHECK(decode_eip712_envelope(altered).error() == DecodingError::kMalformedAddress);
    }

    SECTION("nested factory dependency") {
        const Bytes altered{alter_fields(encoded, [](rlp::ItemList& fields) {
            field(fields, Eip712BroadcastField::kFactoryDeps) = rlp::Item{rlp::ItemList{rlp::Item{rlp::ItemList{}}}};
        })};
        CHECK(decode_eip712_envelope(altered).error() == DecodingError::kUnexpectedVariantShape);
    }
}

TEST_CASE("EIP-712 destination normalisation") {
    const Bytes encoded{encode(sample_envelope())};

    const Bytes empty_to{alter_fields(encoded, [](rlp::ItemList& fields) {
        field(fields, Eip712BroadcastField::kTo) = rlp::Item{ByteView{}};
    })};
    const auto decoded{decode_eip712_envelope(empty_to)};
    REQUIRE(decoded);
    CHECK(decoded->to == kContractDeploymentAddress);
    CHECK(is_contract_deployment(decoded->to));

    Eip712Envelope deployment{sample_envelope()};
    deployment.to = kContractDeploymentAddress;
    const Bytes deployment_encoded{encode(deployment)};
    CHECK(to_hex(deployment_encoded) ==
          "71f860018405f5e100840ee6b28082520880808082010e808082010e8080c0b841"
          "0000000000000000000000000000000000000000000000000000000000000001"
          "0000000000000000000000000000000000000000000000000000000000000002"
          "1bc0");
    CHECK(rlp::length(deployment) == deployment_encoded.size());

    ByteView view{deployment_encoded};
    view.remove_prefix(1);
    const auto item{rlp::decode_item(view)};
    REQUIRE(item);
    REQUIRE(item->is_list());
    const rlp::Item& to_item{(*item->list())[static_cast<size_t>(Eip712BroadcastField::kTo)]};
    REQUIRE(to_item.is_string());
    CHECK(to_item.string()->empty());

    const auto redecoded{decode_eip712_envelope(deployment_encoded)};
    REQUIRE(redecoded);
    CHECK(redecoded->to == kContractDeploymentAddress);

    Bytes signing;
    deployment.encode_for_signing(signing);
    CHECK(to_hex(signing) == "71d8018405f5e100840ee6b2808252088080808082010e80c0c0");
}

TEST_CASE("EIP-712 paymaster is all or nothing on the wire") {
    const Bytes encoded{encode(sample_envelope())};
    static const Bytes kPaymasterBytes{kPaymaster.bytes, kAddressLength};

    SECTION("address only") {
        const Bytes altered{alter_fields(encoded, [](rlp::ItemList& fields) {
            field(fields, Eip712BroadcastField::kPaymasterParams) = rlp::Item{rlp::ItemList{rlp::Item{ByteView{kPaymasterBytes}}}};
        })};
        const auto decoded{decode_eip712_envelope(altered)};
        REQUIRE(decoded);
        CHECK(!decoded->meta->paymaster_params);
    }

    SECTION("two addresses") {
        const Bytes altered{alter_fields(encoded, [](rlp::ItemList& fields) {
            field(fields, Eip712BroadcastField::kPaymasterParams) =
                rlp::Item{rlp::ItemList{rlp::Item{ByteView{kPaymasterBytes}}, rlp::Item{ByteView{kPaymasterBytes}}}};
        })};
        CHECK(decode_eip712_envelope(altered).error() == DecodingError::kUnexpectedVariantShape);
    }

    SECTION("incomplete pair is not encoded") {
        Eip712Envelope txn{sample_envelope()};
        txn.meta = Eip712Meta{.paymaster_params = PaymasterParams{.paymaster = kPaymaster}};
        const auto decoded{decode_eip712_envelope(encode(txn))};
        REQUIRE(decoded);
        CHECK(!decoded->meta->paymaster_params);
    }
}

TEST_CASE("EIP-712 signing encoding") {
    Eip712Envelope txn{sample_envelope()};

    SECTION("no metadata") {
        Bytes encoded;
        txn.encode_for_signing(encoded);
        CHECK(to_hex(encoded) == "71ec018405f5e100840ee6b28082520894000000000000000000000000000000000000800680808082010e80c0c0");
    }

    SECTION("with metadata") {
        txn.meta = Eip712Meta{.gas_per_pubdata = 50'000, .factory_deps = {*from_hex("dead")}};
        Bytes encoded;
        txn.encode_for_signing(encoded);
        CHECK(to_hex(encoded) ==
              "71f5018405f5e100840ee6b28082520894000000000000000000000000000000000000800680808082010e80c0c982c35080c0c382dead");
    }

    SECTION("sender as checksummed text") {
        txn.from = 0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed_address;
        txn.access_list = {{.account = kPaymaster}};
        Bytes encoded;
        txn.encode_for_signing(encoded);

        ByteView view{encoded};
        view.remove_prefix(1);
        const auto item{rlp::decode_item(view)};
        REQUIRE(item);
        const rlp::ItemList& fields{*item->list()};
        REQUIRE(fields.size() == static_cast<size_t>(Eip712SigningField::kCount));

        const ByteView from{*fields[static_cast<size_t>(Eip712SigningField::kFrom)].string()};
        CHECK(std::string{reinterpret_cast<const char*>(from.data()), from.size()} ==
              "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
        CHECK(fields[static_cast<size_t>(Eip712SigningField::kAccessList)].list()->size() == 1);
        CHECK(fields[static_cast<size_t>(Eip712SigningField::kMeta)].list()->empty());
    }
}

TEST_CASE("EIP-712 envelope description") {
    const std::string description{sample_envelope().to_string()};
    CHECK(description.find("type: 0x71") != std::string::npos);
    CHECK(description.find("chain_id: 270") != std::string::npos);
    CHECK(description.find("to: 0x0000000000000000000000000000000000008006") != std::string::npos);
    CHECK(description.find("v: 0x1b") != std::string::npos);
}

}  // namespace txcodec
