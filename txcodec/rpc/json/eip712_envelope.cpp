// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "eip712_envelope.hpp"

#include <array>
#include <string_view>

#include <magic_enum.hpp>

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/types/address.hpp>
#include <txcodec/infra/common/decoding_exception.hpp>
#include <txcodec/infra/common/log.hpp>
#include <txcodec/rpc/json/access_list_entry.hpp>
#include <txcodec/rpc/json/eip712_meta.hpp>
#include <txcodec/rpc/json/hex.hpp>

#include "types.hpp"

namespace txcodec::rpc {

static constexpr std::array<std::string_view, 7> kRequiredKeys{"to", "nonce", "value", "chainId", "v", "r", "s"};

static bool has_required_keys(const nlohmann::json& json) {
    for (const auto key : kRequiredKeys) {
        if (!json.contains(std::string{key})) {
            return false;
        }
    }
    return json.contains("data") || json.contains("input");
}

static tl::expected<evmc::address, DecodingError> decode_destination(const nlohmann::json& json) {
    const nlohmann::json* to{find_field(json, "to")};
    if (!to) {
        return kContractDeploymentAddress;
    }
    if (!to->is_string()) {
        return tl::unexpected{DecodingError::kMalformedAddress};
    }
    const auto& hex{to->get_ref<const std::string&>()};
    if (hex == "0x" || hex == "0x0") {
        return kContractDeploymentAddress;
    }
    const auto address{hex_to_address(hex)};
    if (!address) {
        return tl::unexpected{DecodingError::kMalformedAddress};
    }
    return *address;
}

static tl::expected<std::optional<evmc::address>, DecodingError> decode_sender(const nlohmann::json& json) {
    const nlohmann::json* from{find_field(json, "from")};
    if (!from) {
        return std::optional<evmc::address>{};
    }
    if (!from->is_string()) {
        return tl::unexpected{DecodingError::kMalformedAddress};
    }
    const auto address{hex_to_address(from->get_ref<const std::string&>())};
    if (!address) {
        return tl::unexpected{DecodingError::kMalformedAddress};
    }
    return std::optional<evmc::address>{*address};
}

static tl::expected<uint64_t, DecodingError> decode_gas_limit(const nlohmann::json& json) {
    if (find_field(json, "gas")) {
        return required_quantity<uint64_t>(json, "gas");
    }
    return quantity_or<uint64_t>(json, "gasLimit", 0);
}

static tl::expected<Bytes, DecodingError> decode_payload(const nlohmann::json& json) {
    if (find_field(json, "input")) {
        return required_bytes(json, "input");
    }
    return required_bytes(json, "data");
}

static tl::expected<Eip712Envelope, DecodingError> decode_envelope_fields(const nlohmann::json& json) {
    if (!json.is_object()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    if (!has_required_keys(json)) {
        return tl::unexpected{DecodingError::kMissingField};
    }

    Eip712Envelope envelope;

    const auto to{decode_destination(json)};
    if (!to) {
        return tl::unexpected{to.error()};
    }
    envelope.to = *to;

    const auto nonce{required_quantity<uint64_t>(json, "nonce")};
    if (!nonce) {
        return tl::unexpected{nonce.error()};
    }
    envelope.nonce = *nonce;

    const auto value{quantity_or<intx::uint256>(json, "value", 0)};
    if (!value) {
        return tl::unexpected{value.error()};
    }
    envelope.value = *value;

    const auto chain_id{quantity_or<intx::uint256>(json, "chainId", 0)};
    if (!chain_id) {
        return tl::unexpected{chain_id.error()};
    }
    envelope.chain_id = *chain_id;

    auto data{decode_payload(json)};
    if (!data) {
        return tl::unexpected{data.error()};
    }
    envelope.data = std::move(*data);

    const auto v{required_quantity<uint8_t>(json, "v")};
    if (!v) {
        return tl::unexpected{v.error()};
    }
    const auto r{required_quantity<intx::uint256>(json, "r")};
    if (!r) {
        return tl::unexpected{r.error()};
    }
    const auto s{required_quantity<intx::uint256>(json, "s")};
    if (!s) {
        return tl::unexpected{s.error()};
    }
    envelope.v = *v;
    envelope.r = *r;
    envelope.s = *s;

    const auto gas_limit{decode_gas_limit(json)};
    if (!gas_limit) {
        return tl::unexpected{gas_limit.error()};
    }
    envelope.gas_limit = *gas_limit;

    const auto max_priority_fee_per_gas{quantity_or<intx::uint256>(json, "maxPriorityFeePerGas", 0)};
    if (!max_priority_fee_per_gas) {
        return tl::unexpected{max_priority_fee_per_gas.error()};
    }
    envelope.max_priority_fee_per_gas = *max_priority_fee_per_gas;

    const auto max_fee_per_gas{quantity_or<intx::uint256>(json, "maxFeePerGas", 0)};
    if (!max_fee_per_gas) {
        return tl::unexpected{max_fee_per_gas.error()};
    }
    envelope.max_fee_per_gas = *max_fee_per_gas;

    const auto gas_price{quantity_or<intx::uint256>(json, "gasPrice", 0)};
    if (!gas_price) {
        return tl::unexpected{gas_price.error()};
    }
    envelope.gas_price = *gas_price;

    // A malformed access list is replaced by the empty one
    if (const nlohmann::json* access_list{find_field(json, "accessList")}) {
        auto entries{decode_access_list_json(*access_list)};
        if (entries) {
            envelope.access_list = std::move(*entries);
        } else {
            TXC_DEBUG << "accessList ignored: " << magic_enum::enum_name(entries.error());
        }
    }

    const auto from{decode_sender(json)};
    if (!from) {
        return tl::unexpected{from.error()};
    }
    envelope.from = *from;

    if (const nlohmann::json* meta{find_field(json, "eip712Meta")}) {
        auto decoded_meta{decode_meta_json(*meta)};
        if (!decoded_meta) {
            return tl::unexpected{decoded_meta.error()};
        }
        envelope.meta = std::move(*decoded_meta);
    }

    return envelope;
}

tl::expected<Eip712Envelope, DecodingError> decode_envelope_json(const nlohmann::json& json) {
    TXC_TRACE << "decode_envelope_json keys: " << json.size();
    auto envelope{decode_envelope_fields(json)};
    if (!envelope) {
        TXC_DEBUG << "decode_envelope_json failed: " << magic_enum::enum_name(envelope.error());
    }
    return envelope;
}

}  // namespace txcodec::rpc

namespace txcodec {

void to_json(nlohmann::json& json, const Eip712Envelope& envelope) {
    json["type"] = rpc::to_quantity(uint64_t{kEip712TransactionType});
    json["nonce"] = rpc::to_quantity(envelope.nonce);
    json["chainId"] = rpc::to_quantity(envelope.chain_id.value_or(0));
    json["to"] = envelope.to;
    json["value"] = rpc::to_quantity(envelope.value);
    json["data"] = "0x" + to_hex(envelope.data);
    json["gas"] = rpc::to_quantity(envelope.gas_limit);
    json["maxPriorityFeePerGas"] = rpc::to_quantity(envelope.max_priority_fee_per_gas);
    json["maxFeePerGas"] = rpc::to_quantity(envelope.max_fee_per_gas);
    json["gasPrice"] = rpc::to_quantity(envelope.gas_price);
    json["accessList"] = envelope.access_list;
    json["v"] = rpc::to_quantity(envelope.v);
    json["r"] = rpc::to_quantity(envelope.r);
    json["s"] = rpc::to_quantity(envelope.s);
    if (envelope.from) {
        json["from"] = *envelope.from;
    }
    if (envelope.meta) {
        json["eip712Meta"] = *envelope.meta;
    }
}

void from_json(const nlohmann::json& json, Eip712Envelope& envelope) {
    envelope = unwrap_or_throw(rpc::decode_envelope_json(json));
}

}  // namespace txcodec
