// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "eip712_envelope.hpp"

#include <bit>

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/crypto/signature.hpp>
#include <txcodec/core/rlp/encode_vector.hpp>
#include <txcodec/core/rlp/item.hpp>
#include <txcodec/core/types/eip712_fields.hpp>
#include <txcodec/core/types/evmc_bytes32.hpp>

namespace txcodec {

namespace rlp {

    static Header header(const AccessListEntry& e) {
        return {.list = true, .payload_length = kAddressLength + 1 + length(e.storage_keys)};
    }

    size_t length(const AccessListEntry& e) {
        Header h{header(e)};
        return length_of_length(h.payload_length) + h.payload_length;
    }

    void encode(Bytes& to, const AccessListEntry& e) {
        encode_header(to, header(e));
        encode(to, e.account);
        encode(to, e.storage_keys);
    }

    static size_t length(const std::vector<AccessListEntry>& access_list) {
        size_t payload_length{0};
        for (const AccessListEntry& e : access_list) {
            payload_length += length(e);
        }
        return length_of_length(payload_length) + payload_length;
    }

    static void encode(Bytes& to, const std::vector<AccessListEntry>& access_list) {
        size_t payload_length{0};
        for (const AccessListEntry& e : access_list) {
            payload_length += length(e);
        }
        encode_header(to, {.list = true, .payload_length = payload_length});
        for (const AccessListEntry& e : access_list) {
            encode(to, e);
        }
    }

}  // namespace rlp

// Metadata halves as they go on the wire when the envelope carries no metadata
static const std::vector<Bytes> kNoFactoryDeps{};
static const std::optional<PaymasterParams> kNoPaymasterParams{std::nullopt};

static intx::uint256 gas_per_pubdata(const Eip712Envelope& txn) {
    return txn.meta ? txn.meta->gas_per_pubdata.value_or(0) : 0;
}

static const std::vector<Bytes>& factory_deps(const Eip712Envelope& txn) {
    return txn.meta ? txn.meta->factory_deps : kNoFactoryDeps;
}

static const std::optional<PaymasterParams>& paymaster_params(const Eip712Envelope& txn) {
    return txn.meta ? txn.meta->paymaster_params : kNoPaymasterParams;
}

// The sender is signed as the UTF-8 bytes of its checksummed hex form
static Bytes signed_from(const Eip712Envelope& txn) {
    if (!txn.from) {
        return {};
    }
    const std::string hex{address_to_checksum_hex(*txn.from)};
    return Bytes{reinterpret_cast<const uint8_t*>(hex.data()), hex.size()};
}

// Contract creation goes out as the empty string rather than the zero address
static ByteView destination(const evmc::address& to) {
    return is_contract_deployment(to) ? ByteView{} : ByteView{to.bytes};
}

Bytes Eip712Envelope::wire_signature() const {
    if (meta && meta->custom_signature) {
        return *meta->custom_signature;
    }
    return crypto::marshal_signature(r, s, v);
}

namespace rlp {

    static Header broadcast_header(const Eip712Envelope& txn, ByteView signature) {
        const intx::uint256 chain_id{txn.chain_id.value_or(0)};

        Header h{.list = true};
        h.payload_length = length(txn.nonce);
        h.payload_length += length(txn.max_priority_fee_per_gas);
        h.payload_length += length(txn.max_fee_per_gas);
        h.payload_length += length(txn.gas_limit);
        h.payload_length += length(destination(txn.to));
        h.payload_length += length(txn.value);
        h.payload_length += length(txn.data);
        h.payload_length += length(chain_id);
        h.payload_length += 2;  // two reserved empty strings
        h.payload_length += length(chain_id);
        h.payload_length += length(txn.from);
        h.payload_length += length(gas_per_pubdata(txn));
        h.payload_length += length(factory_deps(txn));
        h.payload_length += length(signature);
        h.payload_length += length(paymaster_params(txn));
        return h;
    }

    size_t length(const Eip712Envelope& txn) {
        const Bytes signature{txn.wire_signature()};
        const Header h{broadcast_header(txn, signature)};
        return 1 + length_of_length(h.payload_length) + h.payload_length;
    }

    void encode(Bytes& to, const Eip712Envelope& txn) {
        const Bytes signature{txn.wire_signature()};
        const intx::uint256 chain_id{txn.chain_id.value_or(0)};

        to.push_back(kEip712TransactionType);
        encode_header(to, broadcast_header(txn, signature));

        encode(to, txn.nonce);
        encode(to, txn.max_priority_fee_per_gas);
        encode(to, txn.max_fee_per_gas);
        encode(to, txn.gas_limit);
        encode(to, destination(txn.to));
        encode(to, txn.value);
        encode(to, txn.data);
        encode(to, chain_id);
        to.push_back(kEmptyStringCode);
        to.push_back(kEmptyStringCode);
        encode(to, chain_id);
        encode(to, txn.from);
        encode(to, gas_per_pubdata(txn));
        encode(to, factory_deps(txn));
        encode(to, ByteView{signature});
        encode(to, paymaster_params(txn));
    }

}  // namespace rlp

void Eip712Envelope::encode_for_signing(Bytes& into) const {
    const Bytes from_bytes{signed_from(*this)};
    const intx::uint256 chain{chain_id.value_or(0)};

    rlp::Header h{.list = true};
    h.payload_length = rlp::length(nonce);
    h.payload_length += rlp::length(max_priority_fee_per_gas);
    h.payload_length += rlp::length(max_fee_per_gas);
    h.payload_length += rlp::length(gas_limit);
    h.payload_length += rlp::length(destination(to));
    h.payload_length += rlp::length(from_bytes);
    h.payload_length += rlp::length(value);
    h.payload_length += rlp::length(data);
    h.payload_length += rlp::length(chain);
    h.payload_length += rlp::length(gas_price);
    h.payload_length += rlp::length(access_list);
    h.payload_length += meta ? rlp::length(*meta) : 1;

    into.push_back(kEip712TransactionType);
    rlp::encode_header(into, h);

    rlp::encode(into, nonce);
    rlp::encode(into, max_priority_fee_per_gas);
    rlp::encode(into, max_fee_per_gas);
    rlp::encode(into, gas_limit);
    rlp::encode(into, destination(to));
    rlp::encode(into, from_bytes);
    rlp::encode(into, value);
    rlp::encode(into, data);
    rlp::encode(into, chain);
    rlp::encode(into, gas_price);
    rlp::encode(into, access_list);
    if (meta) {
        rlp::encode(into, *meta);
    } else {
        into.push_back(rlp::kEmptyListCode);
    }
}

evmc::bytes32 Eip712Envelope::hash() const {
    Bytes encoded;
    rlp::encode(encoded, *this);
    return std::bit_cast<evmc_bytes32>(keccak256(encoded));
}

std::string Eip712Envelope::to_string() const {
    std::string out;
    out += "type: 0x71\n";
    out += "chain_id: " + intx::to_string(chain_id.value_or(0)) + "\n";
    out += "nonce: " + std::to_string(nonce) + "\n";
    out += "gas_limit: " + std::to_string(gas_limit) + "\n";
    out += "max_priority_fee_per_gas: " + intx::to_string(max_priority_fee_per_gas) + "\n";
    out += "max_fee_per_gas: " + intx::to_string(max_fee_per_gas) + "\n";
    out += "to: " + address_to_checksum_hex(to) + "\n";
    out += "value: " + intx::to_string(value) + "\n";
    out += "data: " + txcodec::to_hex(data, /*with_prefix=*/true) + "\n";
    out += "access_list: [";
    for (size_t i{0}; i < access_list.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += address_to_checksum_hex(access_list[i].account);
        out += " (" + std::to_string(access_list[i].storage_keys.size()) + " keys)";
    }
    out += "]\n";
    out += "v: 0x" + intx::hex(intx::uint256{v}) + "\n";
    out += "r: 0x" + intx::hex(r) + "\n";
    out += "s: 0x" + intx::hex(s) + "\n";
    return out;
}

tl::expected<Eip712Envelope, DecodingError> decode_eip712_envelope(ByteView from) noexcept {
    using Field = Eip712BroadcastField;

    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    if (from[0] != kEip712TransactionType) {
        return tl::unexpected{DecodingError::kWrongTypeDiscriminant};
    }
    from.remove_prefix(1);

    const auto item{rlp::decode_item(from)};
    if (!item) {
        return tl::unexpected{item.error()};
    }
    const rlp::ItemList* fields{item->list()};
    if (!fields) {
        return tl::unexpected{DecodingError::kUnexpectedString};
    }
    if (fields->size() != static_cast<size_t>(Field::kCount)) {
        return tl::unexpected{DecodingError::kFieldCountMismatch};
    }
    const auto at = [fields](Field f) -> const rlp::Item& { return (*fields)[static_cast<size_t>(f)]; };

    Eip712Envelope txn;
    Eip712Meta meta;

    if (DecodingResult res{eip712::decode_scalar(at(Field::kNonce), txn.nonce)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{eip712::decode_scalar(at(Field::kMaxPriorityFeePerGas), txn.max_priority_fee_per_gas)};
        !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{eip712::decode_scalar(at(Field::kMaxFeePerGas), txn.max_fee_per_gas)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{eip712::decode_scalar(at(Field::kGasLimit), txn.gas_limit)}; !res) {
        return tl::unexpected{res.error()};
    }

    std::optional<evmc::address> to;
    if (DecodingResult res{eip712::decode_address(at(Field::kTo), to)}; !res) {
        return tl::unexpected{res.error()};
    }
    txn.to = to.value_or(kContractDeploymentAddress);

    if (DecodingResult res{eip712::decode_scalar(at(Field::kValue), txn.value)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{eip712::decode_bytes(at(Field::kData), txn.data)}; !res) {
        return tl::unexpected{res.error()};
    }

    // The chain id is carried twice; the second copy wins and the two are not compared
    intx::uint256 chain_id;
    if (DecodingResult res{eip712::decode_scalar(at(Field::kChainId), chain_id)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (!at(Field::kReserved1).is_string() || !at(Field::kReserved2).is_string()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    if (DecodingResult res{eip712::decode_scalar(at(Field::kChainIdDuplicate), chain_id)}; !res) {
        return tl::unexpected{res.error()};
    }
    txn.chain_id = chain_id;

    if (DecodingResult res{eip712::decode_address(at(Field::kFrom), txn.from)}; !res) {
        return tl::unexpected{res.error()};
    }

    intx::uint256 gas_per_pubdata;
    if (DecodingResult res{eip712::decode_scalar(at(Field::kGasPerPubdata), gas_per_pubdata)}; !res) {
        return tl::unexpected{res.error()};
    }
    meta.gas_per_pubdata = gas_per_pubdata;

    if (DecodingResult res{eip712::decode_factory_deps(at(Field::kFactoryDeps), meta.factory_deps)}; !res) {
        return tl::unexpected{res.error()};
    }

    Bytes signature;
    if (DecodingResult res{eip712::decode_bytes(at(Field::kCustomSignature), signature)}; !res) {
        return tl::unexpected{res.error()};
    }
    const auto triplet{crypto::unmarshal_signature(signature)};
    if (!triplet) {
        return tl::unexpected{triplet.error()};
    }
    txn.r = triplet->r;
    txn.s = triplet->s;
    txn.v = triplet->v;
    meta.custom_signature = std::move(signature);

    if (DecodingResult res{eip712::decode_paymaster_params(at(Field::kPaymasterParams), meta.paymaster_params)};
        !res) {
        return tl::unexpected{res.error()};
    }

    txn.meta = std::move(meta);
    return txn;
}

}  // namespace txcodec
